#include "../include/dp_access/value.hpp"

#include <stdexcept>
#include <string>
#include <utility>

RuntimeValue::RuntimeValue() {}
RuntimeValue::RuntimeValue(double value) {
    this->valueScalar = value;
    this->type = typeScalarNumeric;
}

RuntimeValue::RuntimeValue(Eigen::VectorXd value) {
    this->valueVector = std::move(value);
    this->type = typeVectorNumeric;
}

RuntimeValue::RuntimeValue(Eigen::MatrixXd value) {
    this->valueMatrix = std::move(value);
    this->type = typeMatrixNumeric;
}

EvaluationDatatype RuntimeValue::getDatatype() const {
    return this->type;
}

Eigen::Index RuntimeValue::size() const {
    switch (this->type) {
        case typeScalarNumeric: return 1;
        case typeVectorNumeric: return this->valueVector.size();
        case typeMatrixNumeric: return this->valueMatrix.size();
    }
    throw std::invalid_argument("RuntimeValue type is not handled.");
}

Eigen::Index RuntimeValue::rows() const {
    switch (this->type) {
        case typeScalarNumeric: return 1;
        case typeVectorNumeric: return this->valueVector.size();
        case typeMatrixNumeric: return this->valueMatrix.rows();
    }
    throw std::invalid_argument("RuntimeValue type is not handled.");
}

Eigen::VectorXd RuntimeValue::flatten() const {
    switch (this->type) {
        case typeScalarNumeric: return Eigen::VectorXd::Constant(1, this->valueScalar);
        case typeVectorNumeric: return this->valueVector;
        case typeMatrixNumeric:
            return Eigen::Map<const Eigen::VectorXd>(this->valueMatrix.data(), this->valueMatrix.size());
    }
    throw std::invalid_argument("RuntimeValue type is not handled.");
}

RuntimeValue RuntimeValue::reshapeLike(const Eigen::VectorXd& elements) const {
    if (elements.size() != this->size())
        throw std::invalid_argument("cannot reshape " + std::to_string(elements.size()) +
                                    " elements into a value of size " + std::to_string(this->size()));

    switch (this->type) {
        case typeScalarNumeric: return RuntimeValue(elements(0));
        case typeVectorNumeric: return RuntimeValue(Eigen::VectorXd(elements));
        case typeMatrixNumeric: {
            Eigen::MatrixXd matrix = Eigen::Map<const Eigen::MatrixXd>(
                    elements.data(), this->valueMatrix.rows(), this->valueMatrix.cols());
            return RuntimeValue(matrix);
        }
    }
    throw std::invalid_argument("RuntimeValue type is not handled.");
}

RuntimeValue RuntimeValue::map(const std::function<double(double)>& function) const {
    Eigen::VectorXd elements = this->flatten();
    for (Eigen::Index i = 0; i < elements.size(); ++i)
        elements(i) = function(elements(i));
    return this->reshapeLike(elements);
}

RuntimeValue RuntimeValue::selectRows(const std::vector<Eigen::Index>& indices) const {
    const auto count = static_cast<Eigen::Index>(indices.size());
    for (Eigen::Index index : indices)
        if (index < 0 || index >= this->rows())
            throw std::invalid_argument("row index " + std::to_string(index) + " is out of range");

    if (this->type == typeVectorNumeric) {
        Eigen::VectorXd selected(count);
        for (Eigen::Index i = 0; i < count; ++i)
            selected(i) = this->valueVector(indices[i]);
        return RuntimeValue(selected);
    }
    if (this->type == typeMatrixNumeric) {
        Eigen::MatrixXd selected(count, this->valueMatrix.cols());
        for (Eigen::Index i = 0; i < count; ++i)
            selected.row(i) = this->valueMatrix.row(indices[i]);
        return RuntimeValue(selected);
    }
    throw std::invalid_argument("cannot select records from a scalar value");
}

bool RuntimeValue::isBinary() const {
    Eigen::VectorXd elements = this->flatten();
    return ((elements.array() == 0.) || (elements.array() == 1.)).all();
}

double RuntimeValue::mean() const {
    if (this->size() == 0)
        throw std::invalid_argument("mean of an empty value is undefined");
    return this->flatten().mean();
}

RuntimeValue RuntimeValue::operator+(const RuntimeValue& right) const {
    if (right.getDatatype() == typeScalarNumeric) {
        double offset = right.valueScalar;
        return this->map([offset](double element) { return element + offset; });
    }
    if (this->getDatatype() == typeScalarNumeric) {
        double offset = this->valueScalar;
        return right.map([offset](double element) { return element + offset; });
    }
    if (this->getDatatype() == right.getDatatype() && this->rows() == right.rows() && this->size() == right.size())
        return this->reshapeLike(this->flatten() + right.flatten());
    throw std::invalid_argument("RuntimeValue shapes are not compatible for addition.");
}

bool RuntimeValue::operator==(const RuntimeValue& right) const {
    if (this->type != right.type) return false;
    switch (this->type) {
        case typeScalarNumeric: return this->valueScalar == right.valueScalar;
        case typeVectorNumeric:
            return this->valueVector.size() == right.valueVector.size() && this->valueVector == right.valueVector;
        case typeMatrixNumeric:
            return this->valueMatrix.rows() == right.valueMatrix.rows() &&
                   this->valueMatrix.cols() == right.valueMatrix.cols() &&
                   this->valueMatrix == right.valueMatrix;
    }
    return false;
}

bool RuntimeValue::operator!=(const RuntimeValue& right) const {
    return !(*this == right);
}
