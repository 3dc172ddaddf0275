#include "../include/dp_access/adaptive.hpp"
#include "../include/dp_access/errors.hpp"
#include "../include/dp_access/logging.hpp"

#include <cmath>
#include <stdexcept>

AdaptiveDifferentialPrivacy::AdaptiveDifferentialPrivacy(const PrivacyBudget& epsilonDelta,
                                                         const std::shared_ptr<AccessDefinition>& defaultMechanism)
        : _epsilon_delta{epsilonDelta} {
    if (defaultMechanism) {
        this->_default_mechanism = asDifferentiallyPrivate(defaultMechanism);
        if (!this->_default_mechanism)
            throw std::invalid_argument("You can't access differentially private data with a non differentially "
                                        "private mechanism (" + defaultMechanism->get_name() + ")");
    }
}

std::string AdaptiveDifferentialPrivacy::get_name() const {
    return "adaptive";
}

PrivacyBudget AdaptiveDifferentialPrivacy::get_epsilon_delta() const {
    return this->_epsilon_delta;
}

size_t AdaptiveDifferentialPrivacy::get_access_count() const {
    std::lock_guard<std::mutex> lock(this->_history_mutex);
    return this->_access_history.size();
}

RuntimeValue AdaptiveDifferentialPrivacy::apply(const RuntimeValue& data) {
    return this->apply(data, nullptr);
}

RuntimeValue AdaptiveDifferentialPrivacy::apply_with_mechanism(const RuntimeValue& data,
                                                               const std::shared_ptr<AccessDefinition>& mechanism) {
    return this->apply(data, mechanism);
}

RuntimeValue AdaptiveDifferentialPrivacy::apply(const RuntimeValue& data,
                                                const std::shared_ptr<AccessDefinition>& mechanism) {
    std::shared_ptr<DifferentiallyPrivateAccess> mechanismToApply = this->resolveMechanism(mechanism);
    PrivacyBudget cost = mechanismToApply->get_epsilon_delta();

    {
        std::lock_guard<std::mutex> lock(this->_history_mutex);
        this->_access_history.push_back(cost);

        if (this->isBudgetExceeded()) {
            this->_access_history.pop_back();
            logMessage(logWarning, "refused %s query costing %s, budget %s exhausted after %zu accesses",
                       mechanismToApply->get_name().c_str(), cost.toString().c_str(),
                       this->_epsilon_delta.toString().c_str(), this->_access_history.size());
            throw ExceededPrivacyBudgetError(this->_epsilon_delta);
        }
        logMessage(logDebug, "accepted %s query costing %s, access %zu of budget %s",
                   mechanismToApply->get_name().c_str(), cost.toString().c_str(),
                   this->_access_history.size(), this->_epsilon_delta.toString().c_str());
    }

    return mechanismToApply->apply(data);
}

std::shared_ptr<DifferentiallyPrivateAccess> AdaptiveDifferentialPrivacy::resolveMechanism(
        const std::shared_ptr<AccessDefinition>& mechanism) const {
    if (mechanism) {
        auto differentiallyPrivate = asDifferentiallyPrivate(mechanism);
        if (!differentiallyPrivate)
            throw std::invalid_argument("You can't access differentially private data with a non differentially "
                                        "private mechanism (" + mechanism->get_name() + ")");
        return differentiallyPrivate;
    }
    if (!this->_default_mechanism)
        throw std::invalid_argument("Not data access definition provided or default method established");
    return this->_default_mechanism;
}

// the filter is permissive: it only refuses when every applicable theorem is exceeded
bool AdaptiveDifferentialPrivacy::isBudgetExceeded() const {
    bool exceeded = basicAdaptiveCompositionExceeded(this->_access_history, this->_epsilon_delta);
    if (advancedAdaptiveCompositionApplies(this->_epsilon_delta))
        exceeded = exceeded && advancedAdaptiveCompositionExceeded(this->_access_history, this->_epsilon_delta);
    return exceeded;
}

bool advancedAdaptiveCompositionApplies(const PrivacyBudget& epsilonDelta) {
    return 0 < epsilonDelta.get_delta() && epsilonDelta.get_delta() < std::exp(-1.);
}

bool basicAdaptiveCompositionExceeded(const std::vector<PrivacyBudget>& history, const PrivacyBudget& epsilonDelta) {
    double epsilonSum = 0, deltaSum = 0;
    for (const auto& access : history) {
        epsilonSum += access.get_epsilon();
        deltaSum += access.get_delta();
    }
    return epsilonSum > epsilonDelta.get_epsilon() || deltaSum > epsilonDelta.get_delta();
}

bool advancedAdaptiveCompositionExceeded(const std::vector<PrivacyBudget>& history, const PrivacyBudget& epsilonDelta) {
    double globalEpsilon = epsilonDelta.get_epsilon();
    double globalDelta = epsilonDelta.get_delta();
    if (!advancedAdaptiveCompositionApplies(epsilonDelta))
        throw std::invalid_argument("advanced composition needs 0 < delta < exp(-1), got " + epsilonDelta.toString());

    double deltaSum = 0, epsilonSquaredSum = 0, a = 0;
    for (const auto& access : history) {
        double epsilon = access.get_epsilon();
        deltaSum += access.get_delta();
        epsilonSquaredSum += epsilon * epsilon;
        a += epsilon * std::expm1(epsilon) * 0.5;
    }

    double h = globalEpsilon * globalEpsilon / (28.04 * std::log(1 / globalDelta));
    double b = epsilonSquaredSum + h;
    double c = 2 + std::log(epsilonSquaredSum / h + 1);
    double d = std::log(2 / globalDelta);

    double k = a + std::sqrt(b * c * d);

    return k > globalEpsilon || deltaSum > globalDelta * 0.5;
}
