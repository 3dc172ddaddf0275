#include "../include/dp_access_runtime_eigen/sampling.hpp"

#include <boost/math/distributions/binomial.hpp>

#include <cmath>
#include <functional>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

Eigen::Index flattenedRecordSize(const std::vector<Eigen::Index>& dataSize) {
    return std::accumulate(dataSize.begin() + 1, dataSize.end(), Eigen::Index(1), std::multiplies<Eigen::Index>());
}

void checkSampleable(const RuntimeValue& data) {
    if (data.getDatatype() == typeScalarNumeric)
        throw std::invalid_argument("cannot sample records from a scalar value");
    if (data.rows() == 0)
        throw std::invalid_argument("cannot sample records from empty data");
}

// ln(1 + p (e^eps - 1)), rewritten as eps + ln(p + (1 - p) e^-eps) where e^eps would overflow
double amplifiedEpsilon(double proportion, double epsilon) {
    if (epsilon > 1)
        return epsilon + std::log(proportion + (1 - proportion) * std::exp(-epsilon));
    return std::log1p(proportion * std::expm1(epsilon));
}

}

void checkSampleSize(Eigen::Index sampleSize, const std::vector<Eigen::Index>& dataSize) {
    if (dataSize.empty())
        throw std::invalid_argument("data size needs at least one dimension");
    for (Eigen::Index extent : dataSize)
        if (extent <= 0)
            throw std::invalid_argument("data size extents have to be positive");

    Eigen::Index total = 1;
    for (Eigen::Index extent : dataSize) {
        if (total > std::numeric_limits<Eigen::Index>::max() / extent)
            throw std::invalid_argument("data size has more elements than can be indexed");
        total *= extent;
    }

    if (sampleSize <= 0)
        throw std::invalid_argument("Sample size has to be positive, got " + std::to_string(sampleSize));
    if (sampleSize > dataSize[0])
        throw std::invalid_argument("Sample size " + std::to_string(sampleSize) +
                                    " must be less than data size: " + std::to_string(dataSize[0]));
}

Sampler::Sampler(const std::shared_ptr<AccessDefinition>& dpMechanism, Eigen::Index sampleSize,
                 const std::vector<Eigen::Index>& dataSize, const std::shared_ptr<RandomSource>& random)
        : _dp_mechanism{asDifferentiallyPrivate(dpMechanism)}, _random{resolveRandomSource(random)},
          _sample_size{sampleSize}, _data_records{0} {
    if (!this->_dp_mechanism)
        throw std::invalid_argument("Sampling needs a differentially private mechanism");
    checkSampleSize(sampleSize, dataSize);

    Eigen::Index recordSize = flattenedRecordSize(dataSize);
    this->_actual_sample_size = sampleSize * recordSize;
    this->_data_size = dataSize[0] * recordSize;
    this->_data_records = dataSize[0];
}

RuntimeValue Sampler::apply(const RuntimeValue& data) {
    // the reduced cost only holds for data of the declared size
    checkSampleable(data);
    if (data.rows() != this->_data_records || data.size() != this->_data_size)
        throw std::invalid_argument("data of " + std::to_string(data.rows()) + " records and " +
                                    std::to_string(data.size()) + " elements does not match the declared " +
                                    std::to_string(this->_data_records) + " records and " +
                                    std::to_string(this->_data_size) + " elements");
    return this->_dp_mechanism->apply(this->sample(data));
}

PrivacyBudget Sampler::get_epsilon_delta() const {
    return this->epsilon_delta_reduction(this->_dp_mechanism->get_epsilon_delta());
}

SampleWithReplacement::SampleWithReplacement(const std::shared_ptr<AccessDefinition>& dpMechanism,
                                             Eigen::Index sampleSize, const std::vector<Eigen::Index>& dataSize,
                                             const std::shared_ptr<RandomSource>& random)
        : Sampler(dpMechanism, sampleSize, dataSize, random) {}

std::string SampleWithReplacement::get_name() const {
    return "sample-with-replacement";
}

RuntimeValue SampleWithReplacement::sample(const RuntimeValue& data) {
    checkSampleable(data);

    std::vector<Eigen::Index> indices;
    indices.reserve(static_cast<size_t>(this->_sample_size));
    for (Eigen::Index i = 0; i < this->_sample_size; ++i)
        indices.push_back(this->_random->sampleIndex(data.rows()));
    return data.selectRows(indices);
}

PrivacyBudget SampleWithReplacement::epsilon_delta_reduction(const PrivacyBudget& epsilonDelta) const {
    auto n = static_cast<double>(this->_data_size);
    auto m = static_cast<double>(this->_actual_sample_size);

    double proportion = -std::expm1(m * std::log1p(-1 / n));

    // sum over k = 1..m of C(m, k) (1/n)^k (1 - 1/n)^(m - k), the upper tail of Binomial(m, 1/n)
    boost::math::binomial_distribution<double> draws(m, 1 / n);
    double tail = boost::math::cdf(boost::math::complement(draws, 0.));

    return PrivacyBudget(amplifiedEpsilon(proportion, epsilonDelta.get_epsilon()), tail * epsilonDelta.get_delta());
}

SampleWithoutReplacement::SampleWithoutReplacement(const std::shared_ptr<AccessDefinition>& dpMechanism,
                                                   Eigen::Index sampleSize, const std::vector<Eigen::Index>& dataSize,
                                                   const std::shared_ptr<RandomSource>& random)
        : Sampler(dpMechanism, sampleSize, dataSize, random) {}

std::string SampleWithoutReplacement::get_name() const {
    return "sample-without-replacement";
}

// partial fisher-yates over the record indices
RuntimeValue SampleWithoutReplacement::sample(const RuntimeValue& data) {
    checkSampleable(data);
    Eigen::Index rows = data.rows();
    if (this->_sample_size > rows)
        throw std::invalid_argument("cannot draw " + std::to_string(this->_sample_size) +
                                    " records without replacement from " + std::to_string(rows));

    std::vector<Eigen::Index> indices(static_cast<size_t>(rows));
    std::iota(indices.begin(), indices.end(), Eigen::Index(0));
    for (Eigen::Index i = 0; i < this->_sample_size; ++i) {
        Eigen::Index j = i + this->_random->sampleIndex(rows - i);
        std::swap(indices[i], indices[j]);
    }
    indices.resize(static_cast<size_t>(this->_sample_size));
    return data.selectRows(indices);
}

PrivacyBudget SampleWithoutReplacement::epsilon_delta_reduction(const PrivacyBudget& epsilonDelta) const {
    double proportion = static_cast<double>(this->_actual_sample_size) / static_cast<double>(this->_data_size);
    return PrivacyBudget(amplifiedEpsilon(proportion, epsilonDelta.get_epsilon()),
                         proportion * epsilonDelta.get_delta());
}
