#ifndef DP_ACCESS_VALUE_HPP
#define DP_ACCESS_VALUE_HPP

#include <functional>
#include <vector>

#include <Eigen/Dense>

enum EvaluationDatatype {
    typeScalarNumeric, typeVectorNumeric, typeMatrixNumeric
};

// plain numeric payload: the first axis (rows) of a vector or matrix indexes records
class RuntimeValue {
public:
    double valueScalar = 0;
    Eigen::VectorXd valueVector;
    Eigen::MatrixXd valueMatrix;
    EvaluationDatatype type = typeScalarNumeric;

    RuntimeValue();
    explicit RuntimeValue(double value);
    explicit RuntimeValue(Eigen::VectorXd value);
    explicit RuntimeValue(Eigen::MatrixXd value);

    EvaluationDatatype getDatatype() const;

    // total number of elements
    Eigen::Index size() const;
    // extent of the first axis, 1 for scalars
    Eigen::Index rows() const;

    Eigen::VectorXd flatten() const;
    // same shape as this value, elements taken from a flattened vector
    RuntimeValue reshapeLike(const Eigen::VectorXd& elements) const;

    RuntimeValue map(const std::function<double(double)>& function) const;
    RuntimeValue selectRows(const std::vector<Eigen::Index>& indices) const;

    bool isBinary() const;
    double mean() const;

    RuntimeValue operator+(const RuntimeValue& right) const;
    bool operator==(const RuntimeValue& right) const;
    bool operator!=(const RuntimeValue& right) const;
};

#endif //DP_ACCESS_VALUE_HPP
