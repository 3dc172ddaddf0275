#ifndef DP_ACCESS_ERRORS_HPP
#define DP_ACCESS_ERRORS_HPP

#include <stdexcept>

#include "budget.hpp"

// raised when a privacy filter refuses a query; the data cannot be accessed
// with that mechanism anymore
class ExceededPrivacyBudgetError : public std::runtime_error {
    PrivacyBudget _epsilon_delta;
public:
    explicit ExceededPrivacyBudgetError(const PrivacyBudget& epsilonDelta);

    // the global budget which has been surpassed
    const PrivacyBudget& get_epsilon_delta() const;
};

#endif //DP_ACCESS_ERRORS_HPP
