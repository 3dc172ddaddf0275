#ifndef DP_ACCESS_ADAPTIVE_HPP
#define DP_ACCESS_ADAPTIVE_HPP

#include <memory>
#include <mutex>
#include <vector>

#include "access.hpp"
#include "budget.hpp"

/**
 * Adaptive differential privacy through privacy filters.
 *
 * Every query appends the cost of the mechanism it uses to an access history
 * owned by this filter. A query is refused, and its entry rolled back, only
 * when every composition theorem that applies to the global budget reports
 * that the budget is exhausted.
 *
 * References:
 *   Rogers, Roth, Ullman, Vadhan. Privacy Odometers and Filters:
 *   Pay-as-you-Go Composition. https://arxiv.org/abs/1605.08294
 */
class AdaptiveDifferentialPrivacy : public DifferentiallyPrivateAccess {
    PrivacyBudget _epsilon_delta;
    std::shared_ptr<DifferentiallyPrivateAccess> _default_mechanism;
    std::vector<PrivacyBudget> _access_history;
    mutable std::mutex _history_mutex;

    std::shared_ptr<DifferentiallyPrivateAccess> resolveMechanism(
            const std::shared_ptr<AccessDefinition>& mechanism) const;
    bool isBudgetExceeded() const;

public:
    // the default mechanism is optional, without it every query has to supply one
    explicit AdaptiveDifferentialPrivacy(const PrivacyBudget& epsilonDelta,
                                         const std::shared_ptr<AccessDefinition>& defaultMechanism = nullptr);

    std::string get_name() const override;
    PrivacyBudget get_epsilon_delta() const override;

    RuntimeValue apply(const RuntimeValue& data) override;
    RuntimeValue apply(const RuntimeValue& data, const std::shared_ptr<AccessDefinition>& mechanism);
    RuntimeValue apply_with_mechanism(const RuntimeValue& data,
                                      const std::shared_ptr<AccessDefinition>& mechanism) override;

    // number of accesses currently charged against the budget
    size_t get_access_count() const;
};

// theorem 3.6
bool basicAdaptiveCompositionExceeded(const std::vector<PrivacyBudget>& history, const PrivacyBudget& epsilonDelta);
// theorem 5.1, only meaningful for 0 < delta < exp(-1)
bool advancedAdaptiveCompositionExceeded(const std::vector<PrivacyBudget>& history, const PrivacyBudget& epsilonDelta);
bool advancedAdaptiveCompositionApplies(const PrivacyBudget& epsilonDelta);

#endif //DP_ACCESS_ADAPTIVE_HPP
