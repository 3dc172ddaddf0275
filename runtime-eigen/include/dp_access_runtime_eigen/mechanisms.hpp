#ifndef DP_ACCESS_RUNTIME_EIGEN_MECHANISMS_HPP
#define DP_ACCESS_RUNTIME_EIGEN_MECHANISMS_HPP

#include <functional>
#include <memory>

#include <Eigen/Dense>
#include <dp_access/access.hpp>
#include <dp_access/budget.hpp>

#include "utilities.hpp"

// identity, not differentially private
typedef UnprotectedAccess UnrandomizedMechanism;

// components that obfuscate data, with their randomness
class Mechanism : public DifferentiallyPrivateAccess {
protected:
    std::shared_ptr<RandomSource> _random;
public:
    explicit Mechanism(const std::shared_ptr<RandomSource>& random);
};

/**
 * Adds zero-mean laplace noise with scale sensitivity / epsilon to every
 * component of the data.
 */
class LaplaceMechanism : public Mechanism {
    double _sensitivity;
    PrivacyBudget _epsilon_delta;
public:
    explicit LaplaceMechanism(double sensitivity, double epsilon,
                              const std::shared_ptr<RandomSource>& random = nullptr);

    std::string get_name() const override;
    PrivacyBudget get_epsilon_delta() const override;
    RuntimeValue apply(const RuntimeValue& data) override;

    double get_scale() const;
};

/**
 * Adds zero-mean gaussian noise with standard deviation
 * sqrt(2 ln(1.25 / delta)) * sensitivity / epsilon, valid for epsilon in (0, 1).
 */
class GaussianMechanism : public Mechanism {
    double _sensitivity;
    PrivacyBudget _epsilon_delta;
public:
    explicit GaussianMechanism(double sensitivity, const PrivacyBudget& epsilonDelta,
                               const std::shared_ptr<RandomSource>& random = nullptr);

    std::string get_name() const override;
    PrivacyBudget get_epsilon_delta() const override;
    RuntimeValue apply(const RuntimeValue& data) override;

    double get_standard_deviation() const;
};

// scores every candidate output in the range for the given data
typedef std::function<Eigen::VectorXd(const RuntimeValue& data, const Eigen::VectorXd& range)> UtilityFunction;

/**
 * Draws outputs from a range with probability proportional to
 * exp(epsilon * u(data, r) / (2 * delta_u)).
 *
 * One repetition releases a scalar, several release a vector of draws.
 */
class ExponentialMechanism : public Mechanism {
    UtilityFunction _utility;
    Eigen::VectorXd _range;
    double _delta_u;
    PrivacyBudget _epsilon_delta;
    Eigen::Index _repetitions;
public:
    explicit ExponentialMechanism(UtilityFunction utility, Eigen::VectorXd range, double deltaU, double epsilon,
                                  Eigen::Index repetitions = 1,
                                  const std::shared_ptr<RandomSource>& random = nullptr);

    std::string get_name() const override;
    PrivacyBudget get_epsilon_delta() const override;
    RuntimeValue apply(const RuntimeValue& data) override;
};

/**
 * Randomized response with two coins. The first coin (heads with
 * probability probHeadFirst) releases the true value on heads; on tails the
 * outcome of the second coin (heads, 1, with probability probHeadSecond) is
 * released instead.
 */
class RandomizedResponseCoins : public Mechanism {
    double _prob_head_first;
    double _prob_head_second;
    PrivacyBudget _epsilon_delta;
public:
    explicit RandomizedResponseCoins(double probHeadFirst = 0.5, double probHeadSecond = 0.5,
                                     const std::shared_ptr<RandomSource>& random = nullptr);

    std::string get_name() const override;
    PrivacyBudget get_epsilon_delta() const override;
    RuntimeValue apply(const RuntimeValue& data) override;
};

/**
 * Binary randomized response with f0 = P(release 1 | true 0) and
 * f1 = P(release 1 | true 1). The declared epsilon has to cover the privacy
 * loss the probabilities incur.
 */
class RandomizedResponseBinary : public Mechanism {
    double _f0;
    double _f1;
    PrivacyBudget _epsilon_delta;
public:
    explicit RandomizedResponseBinary(double f0, double f1, double epsilon,
                                      const std::shared_ptr<RandomSource>& random = nullptr);

    std::string get_name() const override;
    PrivacyBudget get_epsilon_delta() const override;
    RuntimeValue apply(const RuntimeValue& data) override;
};

double randomizedResponseCoinsEpsilon(double probHeadFirst, double probHeadSecond);
// privacy loss incurred by the binary randomized response probabilities, infinite if unbounded
double randomizedResponseBinaryEpsilon(double f0, double f1);
void checkBinaryData(const RuntimeValue& data);

#endif //DP_ACCESS_RUNTIME_EIGEN_MECHANISMS_HPP
