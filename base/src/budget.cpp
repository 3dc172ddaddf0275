#include "../include/dp_access/budget.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

void checkEpsilonDelta(double epsilon, double delta) {
    if (!std::isfinite(epsilon) || epsilon <= 0)
        throw std::invalid_argument("Epsilon has to be greater than zero, got " + std::to_string(epsilon));
    if (!std::isfinite(delta) || delta < 0 || delta > 1)
        throw std::invalid_argument("Delta has to be in [0, 1], got " + std::to_string(delta));
}

PrivacyBudget::PrivacyBudget(double epsilon, double delta) : _epsilon{epsilon}, _delta{delta} {
    checkEpsilonDelta(epsilon, delta);
}

PrivacyBudget PrivacyBudget::fromList(const std::vector<double>& epsilonDelta) {
    if (epsilonDelta.size() != 2)
        throw std::invalid_argument("epsilon_delta should hold two elements, but " +
                                    std::to_string(epsilonDelta.size()) + " were given");
    return PrivacyBudget(epsilonDelta[0], epsilonDelta[1]);
}

double PrivacyBudget::get_epsilon() const {
    return this->_epsilon;
}

double PrivacyBudget::get_delta() const {
    return this->_delta;
}

std::string PrivacyBudget::toString() const {
    std::ostringstream stream;
    stream << "(" << this->_epsilon << ", " << this->_delta << ")";
    return stream.str();
}

bool PrivacyBudget::operator==(const PrivacyBudget& right) const {
    return this->_epsilon == right._epsilon && this->_delta == right._delta;
}

bool PrivacyBudget::operator!=(const PrivacyBudget& right) const {
    return !(*this == right);
}
