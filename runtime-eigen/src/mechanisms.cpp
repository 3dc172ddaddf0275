
#include "../include/dp_access_runtime_eigen/mechanisms.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <utility>
#include <vector>

namespace {

void checkSensitivity(double sensitivity) {
    if (!std::isfinite(sensitivity) || sensitivity < 0)
        throw std::invalid_argument("Sensitivity has to be finite and non negative, got " +
                                    std::to_string(sensitivity));
}

// log(numerator / denominator) for probabilities, infinite when only the denominator vanishes
double logRatio(double numerator, double denominator) {
    if (numerator == 0 && denominator == 0) return 0;
    if (denominator == 0) return std::numeric_limits<double>::infinity();
    if (numerator == 0) return -std::numeric_limits<double>::infinity();
    return std::log(numerator / denominator);
}

bool isDeterministicProbability(double probability) {
    return probability == 0 || probability == 1;
}

}

Mechanism::Mechanism(const std::shared_ptr<RandomSource>& random) : _random{resolveRandomSource(random)} {}

void checkBinaryData(const RuntimeValue& data) {
    if (!data.isBinary())
        throw std::invalid_argument("This mechanism works with binary data, but input is not binary");
}

LaplaceMechanism::LaplaceMechanism(double sensitivity, double epsilon, const std::shared_ptr<RandomSource>& random)
        : Mechanism(random), _sensitivity{sensitivity}, _epsilon_delta{epsilon, 0} {
    checkSensitivity(sensitivity);
}

std::string LaplaceMechanism::get_name() const {
    return "laplace";
}

PrivacyBudget LaplaceMechanism::get_epsilon_delta() const {
    return this->_epsilon_delta;
}

double LaplaceMechanism::get_scale() const {
    return this->_sensitivity / this->_epsilon_delta.get_epsilon();
}

RuntimeValue LaplaceMechanism::apply(const RuntimeValue& data) {
    double scale = this->get_scale();
    RandomSource& random = *this->_random;
    return data.map([scale, &random](double element) { return element + random.sampleLaplace(0, scale); });
}

GaussianMechanism::GaussianMechanism(double sensitivity, const PrivacyBudget& epsilonDelta,
                                     const std::shared_ptr<RandomSource>& random)
        : Mechanism(random), _sensitivity{sensitivity}, _epsilon_delta{epsilonDelta} {
    checkSensitivity(sensitivity);
    if (epsilonDelta.get_epsilon() >= 1)
        throw std::invalid_argument("In the Gaussian mechanism epsilon have to be greater than 0 and less than 1");
    if (epsilonDelta.get_delta() <= 0)
        throw std::invalid_argument("In the Gaussian mechanism delta have to be greater than 0");
}

std::string GaussianMechanism::get_name() const {
    return "gaussian";
}

PrivacyBudget GaussianMechanism::get_epsilon_delta() const {
    return this->_epsilon_delta;
}

double GaussianMechanism::get_standard_deviation() const {
    return std::sqrt(2 * std::log(1.25 / this->_epsilon_delta.get_delta())) *
           this->_sensitivity / this->_epsilon_delta.get_epsilon();
}

RuntimeValue GaussianMechanism::apply(const RuntimeValue& data) {
    double stddev = this->get_standard_deviation();
    RandomSource& random = *this->_random;
    return data.map([stddev, &random](double element) { return element + random.sampleGaussian(0, stddev); });
}

ExponentialMechanism::ExponentialMechanism(UtilityFunction utility, Eigen::VectorXd range, double deltaU,
                                           double epsilon, Eigen::Index repetitions,
                                           const std::shared_ptr<RandomSource>& random)
        : Mechanism(random), _utility{std::move(utility)}, _range{std::move(range)}, _delta_u{deltaU},
          _epsilon_delta{epsilon, 0}, _repetitions{repetitions} {
    if (!this->_utility)
        throw std::invalid_argument("The exponential mechanism needs a utility function");
    if (this->_range.size() == 0)
        throw std::invalid_argument("The exponential mechanism needs a non empty output range");
    if (!std::isfinite(deltaU) || deltaU <= 0)
        throw std::invalid_argument("The utility sensitivity delta_u has to be greater than zero");
    if (repetitions < 1)
        throw std::invalid_argument("The exponential mechanism needs at least one repetition");
}

std::string ExponentialMechanism::get_name() const {
    return "exponential";
}

PrivacyBudget ExponentialMechanism::get_epsilon_delta() const {
    return this->_epsilon_delta;
}

RuntimeValue ExponentialMechanism::apply(const RuntimeValue& data) {
    Eigen::VectorXd utilities = this->_utility(data, this->_range);
    if (utilities.size() != this->_range.size())
        throw std::invalid_argument("The utility function has to score every element of the range");
    if (!utilities.allFinite())
        throw std::invalid_argument("The utility function returned non finite scores");

    // shifting by the best score keeps exp() in range without changing the distribution
    double exponentScale = this->_epsilon_delta.get_epsilon() / (2 * this->_delta_u);
    Eigen::VectorXd weights = ((utilities.array() - utilities.maxCoeff()) * exponentScale).exp().matrix();

    std::vector<double> cumulative(static_cast<size_t>(weights.size()));
    std::partial_sum(weights.data(), weights.data() + weights.size(), cumulative.begin());
    double total = cumulative.back();

    Eigen::VectorXd draws(this->_repetitions);
    for (Eigen::Index i = 0; i < this->_repetitions; ++i) {
        double target = this->_random->sampleUniform() * total;
        auto it = std::upper_bound(cumulative.begin(), cumulative.end(), target);
        auto index = std::min<Eigen::Index>(std::distance(cumulative.begin(), it), this->_range.size() - 1);
        draws(i) = this->_range(index);
    }

    if (this->_repetitions == 1)
        return RuntimeValue(draws(0));
    return RuntimeValue(draws);
}

double randomizedResponseCoinsEpsilon(double probHeadFirst, double probHeadSecond) {
    if (!(probHeadFirst > 0 && probHeadFirst < 1) || !(probHeadSecond > 0 && probHeadSecond < 1))
        throw std::invalid_argument("Coin probabilities have to be in (0, 1), got " +
                                    std::to_string(probHeadFirst) + " and " + std::to_string(probHeadSecond));

    double oneGivenOne = probHeadFirst + (1 - probHeadFirst) * probHeadSecond;
    double oneGivenZero = (1 - probHeadFirst) * probHeadSecond;
    double zeroGivenZero = probHeadFirst + (1 - probHeadFirst) * (1 - probHeadSecond);
    double zeroGivenOne = (1 - probHeadFirst) * (1 - probHeadSecond);

    return std::max(std::log(oneGivenOne / oneGivenZero), std::log(zeroGivenZero / zeroGivenOne));
}

RandomizedResponseCoins::RandomizedResponseCoins(double probHeadFirst, double probHeadSecond,
                                                 const std::shared_ptr<RandomSource>& random)
        : Mechanism(random), _prob_head_first{probHeadFirst}, _prob_head_second{probHeadSecond},
          _epsilon_delta{randomizedResponseCoinsEpsilon(probHeadFirst, probHeadSecond), 0} {}

std::string RandomizedResponseCoins::get_name() const {
    return "randomized-response-coins";
}

PrivacyBudget RandomizedResponseCoins::get_epsilon_delta() const {
    return this->_epsilon_delta;
}

RuntimeValue RandomizedResponseCoins::apply(const RuntimeValue& data) {
    checkBinaryData(data);

    double probHeadFirst = this->_prob_head_first;
    double probHeadSecond = this->_prob_head_second;
    RandomSource& random = *this->_random;
    return data.map([probHeadFirst, probHeadSecond, &random](double element) {
        if (random.sampleBernoulli(probHeadFirst)) return element;
        return random.sampleBernoulli(probHeadSecond) ? 1. : 0.;
    });
}

double randomizedResponseBinaryEpsilon(double f0, double f1) {
    return std::max(std::abs(logRatio(f1, f0)), std::abs(logRatio(1 - f1, 1 - f0)));
}

RandomizedResponseBinary::RandomizedResponseBinary(double f0, double f1, double epsilon,
                                                   const std::shared_ptr<RandomSource>& random)
        : Mechanism(random), _f0{f0}, _f1{f1}, _epsilon_delta{epsilon, 0} {
    if (!(f0 >= 0 && f0 <= 1) || !(f1 >= 0 && f1 <= 1))
        throw std::invalid_argument("f0 and f1 have to be probabilities, got " +
                                    std::to_string(f0) + " and " + std::to_string(f1));
    if (isDeterministicProbability(f0) && isDeterministicProbability(f1))
        throw std::invalid_argument("Deterministic method, the release is not randomized");

    double requiredEpsilon = randomizedResponseBinaryEpsilon(f0, f1);
    if (epsilon < requiredEpsilon)
        throw std::invalid_argument("Epsilon " + std::to_string(epsilon) + " is lower than the privacy loss " +
                                    std::to_string(requiredEpsilon) + " of f0 and f1");
}

std::string RandomizedResponseBinary::get_name() const {
    return "randomized-response-binary";
}

PrivacyBudget RandomizedResponseBinary::get_epsilon_delta() const {
    return this->_epsilon_delta;
}

RuntimeValue RandomizedResponseBinary::apply(const RuntimeValue& data) {
    checkBinaryData(data);

    double f0 = this->_f0;
    double f1 = this->_f1;
    RandomSource& random = *this->_random;
    return data.map([f0, f1, &random](double element) {
        return random.sampleBernoulli(element == 1 ? f1 : f0) ? 1. : 0.;
    });
}
