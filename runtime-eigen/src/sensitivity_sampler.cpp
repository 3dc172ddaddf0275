#include "../include/dp_access_runtime_eigen/sensitivity_sampler.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/math/special_functions/lambert_w.hpp>

#include <dp_access/logging.hpp>

namespace {

// replaces the last record of the database with a fresh draw
RuntimeValue replaceLastRecord(const RuntimeValue& database, ProbabilityDistribution& distribution) {
    RuntimeValue record = distribution.sample(1);
    RuntimeValue neighbour = database;

    switch (database.getDatatype()) {
        case typeScalarNumeric:
            return record.getDatatype() == typeScalarNumeric
                   ? record : RuntimeValue(record.flatten()(0));
        case typeVectorNumeric:
            neighbour.valueVector(neighbour.valueVector.size() - 1) = record.flatten()(0);
            return neighbour;
        case typeMatrixNumeric: {
            Eigen::VectorXd flat = record.flatten();
            if (flat.size() != database.valueMatrix.cols())
                throw std::invalid_argument("sampled record does not match the database columns");
            neighbour.valueMatrix.row(neighbour.valueMatrix.rows() - 1) = flat.transpose();
            return neighbour;
        }
    }
    throw std::invalid_argument("unsupported database datatype");
}

}

SensitivitySampler::SensitivitySampler(SamplingPolicy policy) : _policy{policy} {}

SensitivitySamplerConfig SensitivitySampler::configureFromSamples(Eigen::Index m) {
    if (m <= 0)
        throw std::invalid_argument("the sensitivity sampler needs a positive number of samples");

    double md = static_cast<double>(m);
    double rho = std::exp(boost::math::lambert_wm1(-1. / (2. * std::sqrt(std::exp(1.) * md))) + 0.5);
    double gamma = rho + std::sqrt(std::log(1. / rho) / (2. * md));

    SensitivitySamplerConfig config{m, m, gamma};
    return config;
}

SensitivitySamplerConfig SensitivitySampler::configureFromGamma(double gamma) {
    if (!(gamma > 0 && gamma < 1))
        throw std::invalid_argument("gamma must lie in (0, 1), got " + std::to_string(gamma));

    double rho = std::exp(boost::math::lambert_wm1(-gamma / (2. * std::sqrt(std::exp(1.)))) + 0.5);
    double mRaw = std::ceil(std::log(1. / rho) / (2. * (gamma - rho) * (gamma - rho)));
    double kRaw = std::ceil(mRaw * (1. - gamma + rho + std::sqrt(std::log(1. / rho) / (2. * mRaw))));

    auto m = static_cast<Eigen::Index>(mRaw);
    auto k = static_cast<Eigen::Index>(std::min(std::max(kRaw, 1.), mRaw));

    SensitivitySamplerConfig config{m, k, gamma};
    return config;
}

double SensitivitySampler::sampleIteration(const Query& query, const SensitivityNorm& norm,
                                           ProbabilityDistribution& distribution, Eigen::Index n) const {
    RuntimeValue first = distribution.sample(n);
    RuntimeValue second = this->_policy == neighbouringSamples
                          ? replaceLastRecord(first, distribution)
                          : distribution.sample(n);

    return norm.compute(query.get(first), query.get(second));
}

SensitivityEstimate SensitivitySampler::sample_sensitivity(const Query& query, const SensitivityNorm& norm,
                                                           ProbabilityDistribution& distribution, Eigen::Index n,
                                                           Eigen::Index m, double gamma) const {
    if (n <= 0)
        throw std::invalid_argument("the sampled databases need at least one record");

    bool hasSamples = m != 0;
    bool hasGamma = !std::isnan(gamma);
    if (hasSamples == hasGamma)
        throw std::invalid_argument("exactly one of m or gamma must be given to the sensitivity sampler");

    SensitivitySamplerConfig config = hasSamples ? configureFromSamples(m) : configureFromGamma(gamma);
    logMessage(logDebug, "sensitivity sampler: m=%ld k=%ld gamma=%f",
               static_cast<long>(config.m), static_cast<long>(config.k), config.gamma);

    std::vector<double> distances(static_cast<size_t>(config.m));
    for (double& distance : distances)
        distance = this->sampleIteration(query, norm, distribution, n);

    std::sort(distances.begin(), distances.end());

    double total = 0;
    for (double distance : distances)
        total += distance;

    SensitivityEstimate estimate{distances[static_cast<size_t>(config.k - 1)],
                                 total / static_cast<double>(distances.size())};
    return estimate;
}
