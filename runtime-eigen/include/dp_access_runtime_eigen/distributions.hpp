#ifndef DP_ACCESS_RUNTIME_EIGEN_DISTRIBUTIONS_HPP
#define DP_ACCESS_RUNTIME_EIGEN_DISTRIBUTIONS_HPP

#include <memory>

#include <Eigen/Dense>
#include <dp_access/value.hpp>

#include "utilities.hpp"

// oracle producing databases of a given number of records
class ProbabilityDistribution {
public:
    virtual ~ProbabilityDistribution() = default;
    virtual RuntimeValue sample(Eigen::Index size) = 0;
};

class NormalDistribution : public ProbabilityDistribution {
    double _mean;
    double _std;
    std::shared_ptr<RandomSource> _random;
public:
    explicit NormalDistribution(double mean, double deviation, const std::shared_ptr<RandomSource>& random = nullptr);
    RuntimeValue sample(Eigen::Index size) override;
};

// params holds one (mean, std) row per component
class GaussianMixture : public ProbabilityDistribution {
    Eigen::MatrixXd _params;
    Eigen::VectorXd _weights;
    std::shared_ptr<RandomSource> _random;
public:
    explicit GaussianMixture(Eigen::MatrixXd params, Eigen::VectorXd weights,
                             const std::shared_ptr<RandomSource>& random = nullptr);
    RuntimeValue sample(Eigen::Index size) override;
};

// records drawn without replacement from a finite pool
class ResampledDistribution : public ProbabilityDistribution {
    RuntimeValue _pool;
    std::shared_ptr<RandomSource> _random;
public:
    explicit ResampledDistribution(RuntimeValue pool, const std::shared_ptr<RandomSource>& random = nullptr);
    RuntimeValue sample(Eigen::Index size) override;
};

#endif //DP_ACCESS_RUNTIME_EIGEN_DISTRIBUTIONS_HPP
