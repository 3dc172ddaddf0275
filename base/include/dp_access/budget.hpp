#ifndef DP_ACCESS_BUDGET_HPP
#define DP_ACCESS_BUDGET_HPP

#include <string>
#include <vector>

// (epsilon, delta) privacy budget, validated on construction
class PrivacyBudget {
    double _epsilon;
    double _delta;
public:
    explicit PrivacyBudget(double epsilon, double delta = 0);

    // from a tuple-like list, which must hold exactly two entries
    static PrivacyBudget fromList(const std::vector<double>& epsilonDelta);

    double get_epsilon() const;
    double get_delta() const;

    std::string toString() const;

    bool operator==(const PrivacyBudget& right) const;
    bool operator!=(const PrivacyBudget& right) const;
};

void checkEpsilonDelta(double epsilon, double delta);

#endif //DP_ACCESS_BUDGET_HPP
