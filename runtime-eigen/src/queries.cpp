#include "../include/dp_access_runtime_eigen/queries.hpp"

RuntimeValue IdentityFunction::get(const RuntimeValue& data) const {
    return data;
}

RuntimeValue Mean::get(const RuntimeValue& data) const {
    return RuntimeValue(data.mean());
}
