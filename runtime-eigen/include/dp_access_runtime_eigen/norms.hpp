#ifndef DP_ACCESS_RUNTIME_EIGEN_NORMS_HPP
#define DP_ACCESS_RUNTIME_EIGEN_NORMS_HPP

#include <dp_access/value.hpp>

// distance between two query outputs
class SensitivityNorm {
public:
    virtual ~SensitivityNorm() = default;
    virtual double compute(const RuntimeValue& x1, const RuntimeValue& x2) const = 0;
};

class L1SensitivityNorm : public SensitivityNorm {
public:
    double compute(const RuntimeValue& x1, const RuntimeValue& x2) const override;
};

class L2SensitivityNorm : public SensitivityNorm {
public:
    double compute(const RuntimeValue& x1, const RuntimeValue& x2) const override;
};

#endif //DP_ACCESS_RUNTIME_EIGEN_NORMS_HPP
