#include "../include/dp_access_runtime_eigen/distributions.hpp"

#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

void checkRequestedSize(Eigen::Index size) {
    if (size <= 0)
        throw std::invalid_argument("cannot sample " + std::to_string(size) + " records");
}

}

NormalDistribution::NormalDistribution(double mean, double deviation, const std::shared_ptr<RandomSource>& random)
        : _mean{mean}, _std{deviation}, _random{resolveRandomSource(random)} {
    if (!std::isfinite(mean) || !std::isfinite(this->_std) || this->_std < 0)
        throw std::invalid_argument("a normal distribution needs a finite mean and a non negative deviation");
}

RuntimeValue NormalDistribution::sample(Eigen::Index size) {
    checkRequestedSize(size);
    Eigen::VectorXd samples(size);
    for (Eigen::Index i = 0; i < size; ++i)
        samples(i) = this->_random->sampleGaussian(this->_mean, this->_std);
    return RuntimeValue(samples);
}

GaussianMixture::GaussianMixture(Eigen::MatrixXd params, Eigen::VectorXd weights,
                                 const std::shared_ptr<RandomSource>& random)
        : _params{std::move(params)}, _weights{std::move(weights)}, _random{resolveRandomSource(random)} {
    if (this->_params.cols() != 2 || this->_params.rows() == 0)
        throw std::invalid_argument("a gaussian mixture needs one (mean, std) row per component");
    if (this->_weights.size() != this->_params.rows())
        throw std::invalid_argument("a gaussian mixture needs one weight per component");
    if ((this->_weights.array() < 0).any() || this->_weights.sum() <= 0)
        throw std::invalid_argument("gaussian mixture weights have to be non negative with a positive sum");
    if ((this->_params.col(1).array() < 0).any())
        throw std::invalid_argument("gaussian mixture deviations have to be non negative");
}

RuntimeValue GaussianMixture::sample(Eigen::Index size) {
    checkRequestedSize(size);
    double total = this->_weights.sum();

    Eigen::VectorXd samples(size);
    for (Eigen::Index i = 0; i < size; ++i) {
        double target = this->_random->sampleUniform() * total;
        Eigen::Index component = 0;
        double cumulative = this->_weights(0);
        while (cumulative <= target && component < this->_weights.size() - 1)
            cumulative += this->_weights(++component);
        samples(i) = this->_random->sampleGaussian(this->_params(component, 0), this->_params(component, 1));
    }
    return RuntimeValue(samples);
}

ResampledDistribution::ResampledDistribution(RuntimeValue pool, const std::shared_ptr<RandomSource>& random)
        : _pool{std::move(pool)}, _random{resolveRandomSource(random)} {
    if (this->_pool.getDatatype() == typeScalarNumeric)
        throw std::invalid_argument("a resampled distribution needs a pool of records");
}

RuntimeValue ResampledDistribution::sample(Eigen::Index size) {
    checkRequestedSize(size);
    Eigen::Index rows = this->_pool.rows();
    if (size > rows)
        throw std::invalid_argument("cannot draw " + std::to_string(size) + " records from a pool of " +
                                    std::to_string(rows));

    std::vector<Eigen::Index> indices(static_cast<size_t>(rows));
    std::iota(indices.begin(), indices.end(), Eigen::Index(0));
    for (Eigen::Index i = 0; i < size; ++i)
        std::swap(indices[i], indices[i + this->_random->sampleIndex(rows - i)]);
    indices.resize(static_cast<size_t>(size));
    return this->_pool.selectRows(indices);
}
