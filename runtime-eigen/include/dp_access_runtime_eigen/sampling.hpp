#ifndef DP_ACCESS_RUNTIME_EIGEN_SAMPLING_HPP
#define DP_ACCESS_RUNTIME_EIGEN_SAMPLING_HPP

#include <memory>
#include <vector>

#include <Eigen/Dense>
#include <dp_access/access.hpp>
#include <dp_access/budget.hpp>

#include "utilities.hpp"

/**
 * Applies a differentially private mechanism to a sample of the records,
 * which reduces the epsilon-delta spent by that mechanism.
 *
 * Only the first axis of the data is sampled; for data with more than one
 * dimension both sizes are flattened over the remaining axes.
 *
 * References:
 *   Balle, Barthe, Gaboardi. Privacy Amplification by Subsampling: Tight
 *   Analyses via Couplings and Divergences. https://arxiv.org/abs/1807.01647
 */
class Sampler : public DifferentiallyPrivateAccess {
protected:
    std::shared_ptr<DifferentiallyPrivateAccess> _dp_mechanism;
    std::shared_ptr<RandomSource> _random;
    Eigen::Index _sample_size;
    Eigen::Index _data_records;
    // flattened sizes
    Eigen::Index _actual_sample_size;
    Eigen::Index _data_size;

public:
    explicit Sampler(const std::shared_ptr<AccessDefinition>& dpMechanism, Eigen::Index sampleSize,
                     const std::vector<Eigen::Index>& dataSize, const std::shared_ptr<RandomSource>& random);

    RuntimeValue apply(const RuntimeValue& data) override;
    PrivacyBudget get_epsilon_delta() const override;

    virtual RuntimeValue sample(const RuntimeValue& data) = 0;
    // the hopefully reduced budget of a mechanism run on a sample
    virtual PrivacyBudget epsilon_delta_reduction(const PrivacyBudget& epsilonDelta) const = 0;
};

// theorem 10
class SampleWithReplacement : public Sampler {
public:
    explicit SampleWithReplacement(const std::shared_ptr<AccessDefinition>& dpMechanism, Eigen::Index sampleSize,
                                   const std::vector<Eigen::Index>& dataSize,
                                   const std::shared_ptr<RandomSource>& random = nullptr);

    std::string get_name() const override;
    RuntimeValue sample(const RuntimeValue& data) override;
    PrivacyBudget epsilon_delta_reduction(const PrivacyBudget& epsilonDelta) const override;
};

// theorem 9
class SampleWithoutReplacement : public Sampler {
public:
    explicit SampleWithoutReplacement(const std::shared_ptr<AccessDefinition>& dpMechanism, Eigen::Index sampleSize,
                                      const std::vector<Eigen::Index>& dataSize,
                                      const std::shared_ptr<RandomSource>& random = nullptr);

    std::string get_name() const override;
    RuntimeValue sample(const RuntimeValue& data) override;
    PrivacyBudget epsilon_delta_reduction(const PrivacyBudget& epsilonDelta) const override;
};

void checkSampleSize(Eigen::Index sampleSize, const std::vector<Eigen::Index>& dataSize);

#endif //DP_ACCESS_RUNTIME_EIGEN_SAMPLING_HPP
