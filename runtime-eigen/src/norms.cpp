#include "../include/dp_access_runtime_eigen/norms.hpp"

#include <stdexcept>
#include <string>

namespace {

Eigen::VectorXd difference(const RuntimeValue& x1, const RuntimeValue& x2) {
    if (x1.size() != x2.size())
        throw std::invalid_argument("cannot compare outputs of sizes " + std::to_string(x1.size()) +
                                    " and " + std::to_string(x2.size()));
    return x1.flatten() - x2.flatten();
}

}

double L1SensitivityNorm::compute(const RuntimeValue& x1, const RuntimeValue& x2) const {
    return difference(x1, x2).lpNorm<1>();
}

double L2SensitivityNorm::compute(const RuntimeValue& x1, const RuntimeValue& x2) const {
    return difference(x1, x2).norm();
}
