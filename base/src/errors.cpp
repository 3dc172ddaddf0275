#include "../include/dp_access/errors.hpp"

ExceededPrivacyBudgetError::ExceededPrivacyBudgetError(const PrivacyBudget& epsilonDelta)
        : std::runtime_error("Error: Privacy Budget " + epsilonDelta.toString() + " has been exceeded"),
          _epsilon_delta{epsilonDelta} {}

const PrivacyBudget& ExceededPrivacyBudgetError::get_epsilon_delta() const {
    return this->_epsilon_delta;
}
