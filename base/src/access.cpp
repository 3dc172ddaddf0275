#include "../include/dp_access/access.hpp"

#include <stdexcept>

RuntimeValue AccessDefinition::apply_with_mechanism(const RuntimeValue& data,
                                                    const std::shared_ptr<AccessDefinition>& mechanism) {
    if (mechanism)
        throw std::invalid_argument("Access definition " + this->get_name() +
                                    " does not accept a mechanism per query");
    return this->apply(data);
}

std::string UnprotectedAccess::get_name() const {
    return "unprotected";
}

RuntimeValue UnprotectedAccess::apply(const RuntimeValue& data) {
    return data;
}

std::shared_ptr<DifferentiallyPrivateAccess> asDifferentiallyPrivate(
        const std::shared_ptr<AccessDefinition>& definition) {
    return std::dynamic_pointer_cast<DifferentiallyPrivateAccess>(definition);
}
