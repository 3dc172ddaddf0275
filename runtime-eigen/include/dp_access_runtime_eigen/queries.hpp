#ifndef DP_ACCESS_RUNTIME_EIGEN_QUERIES_HPP
#define DP_ACCESS_RUNTIME_EIGEN_QUERIES_HPP

#include <dp_access/value.hpp>

// deterministic function of a database whose sensitivity is estimated
class Query {
public:
    virtual ~Query() = default;
    virtual RuntimeValue get(const RuntimeValue& data) const = 0;
};

class IdentityFunction : public Query {
public:
    RuntimeValue get(const RuntimeValue& data) const override;
};

// mean over every element
class Mean : public Query {
public:
    RuntimeValue get(const RuntimeValue& data) const override;
};

#endif //DP_ACCESS_RUNTIME_EIGEN_QUERIES_HPP
