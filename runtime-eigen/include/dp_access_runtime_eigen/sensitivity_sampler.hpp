#ifndef DP_ACCESS_RUNTIME_EIGEN_SENSITIVITY_SAMPLER_HPP
#define DP_ACCESS_RUNTIME_EIGEN_SENSITIVITY_SAMPLER_HPP

#include <limits>

#include <Eigen/Dense>

#include "distributions.hpp"
#include "norms.hpp"
#include "queries.hpp"

struct SensitivityEstimate {
    // k-th smallest sampled distance, the high probability upper bound
    double sensitivity;
    double mean;
};

// number of sampled pairs m, order statistic k and failure probability gamma
struct SensitivitySamplerConfig {
    Eigen::Index m;
    Eigen::Index k;
    double gamma;
};

/**
 * Estimates the sensitivity of a query empirically, for queries whose
 * sensitivity cannot be derived analytically.
 *
 * Exactly one of the sample budget m or the target gamma has to be given,
 * the other quantities follow from the sensitivity sampler configuration.
 *
 * References:
 *   Rubinstein, Alda. Pain-Free Random Differential Privacy with
 *   Sensitivity Sampling. https://arxiv.org/abs/1706.02562
 */
class SensitivitySampler {
public:
    enum SamplingPolicy {
        // the second database replaces the last record of the first
        neighbouringSamples,
        // the second database is an independent draw
        independentSamples
    };

    explicit SensitivitySampler(SamplingPolicy policy = neighbouringSamples);

    SensitivityEstimate sample_sensitivity(const Query& query, const SensitivityNorm& norm,
                                           ProbabilityDistribution& distribution, Eigen::Index n,
                                           Eigen::Index m = 0,
                                           double gamma = std::numeric_limits<double>::quiet_NaN()) const;

    static SensitivitySamplerConfig configureFromSamples(Eigen::Index m);
    static SensitivitySamplerConfig configureFromGamma(double gamma);

private:
    SamplingPolicy _policy;

    double sampleIteration(const Query& query, const SensitivityNorm& norm,
                           ProbabilityDistribution& distribution, Eigen::Index n) const;
};

#endif //DP_ACCESS_RUNTIME_EIGEN_SENSITIVITY_SAMPLER_HPP
