#ifndef DP_ACCESS_ACCESS_HPP
#define DP_ACCESS_ACCESS_HPP

#include <memory>
#include <string>

#include "budget.hpp"
#include "value.hpp"

// most elementary primitive: how a private value may be read
class AccessDefinition {
public:
    virtual ~AccessDefinition() = default;

    virtual std::string get_name() const = 0;
    virtual RuntimeValue apply(const RuntimeValue& data) = 0;

    // only definitions which resolve a mechanism per call (privacy filters)
    // accept an override; the default rejects it
    virtual RuntimeValue apply_with_mechanism(const RuntimeValue& data,
                                              const std::shared_ptr<AccessDefinition>& mechanism);
};

// access definitions that obfuscate data and know their own privacy cost
class DifferentiallyPrivateAccess : public AccessDefinition {
public:
    virtual PrivacyBudget get_epsilon_delta() const = 0;
};

// identity access with no privacy guarantee
class UnprotectedAccess : public AccessDefinition {
public:
    std::string get_name() const override;
    RuntimeValue apply(const RuntimeValue& data) override;
};

// null when the definition is not differentially private
std::shared_ptr<DifferentiallyPrivateAccess> asDifferentiallyPrivate(
        const std::shared_ptr<AccessDefinition>& definition);

#endif //DP_ACCESS_ACCESS_HPP
