#ifndef DP_ACCESS_POLICY_HPP
#define DP_ACCESS_POLICY_HPP

#include <memory>

#include <access_policy.pb.h>
#include <dp_access/access.hpp>
#include <dp_access_runtime_eigen/utilities.hpp>

// constructs the live access definition chain a policy describes
std::shared_ptr<AccessDefinition> buildAccessDefinition(const dp_access::AccessPolicy& policy,
                                                        const std::shared_ptr<RandomSource>& random = nullptr);

// true if every definition in the chain can be constructed
bool validatePolicy(const dp_access::AccessPolicy& policy);

// name, differential privacy and (epsilon, delta) of the outermost definition
dp_access::PrivacyUsage computePrivacyUsage(const dp_access::AccessPolicy& policy);

#endif //DP_ACCESS_POLICY_HPP
