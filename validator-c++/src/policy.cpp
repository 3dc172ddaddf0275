#include "../include/dp_access/policy.hpp"

#include <stdexcept>
#include <vector>

#include <dp_access/adaptive.hpp>
#include <dp_access/budget.hpp>
#include <dp_access/logging.hpp>
#include <dp_access_runtime_eigen/mechanisms.hpp>
#include <dp_access_runtime_eigen/sampling.hpp>

namespace {

PrivacyBudget toPrivacyBudget(const dp_access::EpsilonDelta& epsilonDelta) {
    return PrivacyBudget(epsilonDelta.epsilon(), epsilonDelta.delta());
}

std::shared_ptr<AccessDefinition> buildSubsample(const dp_access::Subsample& subsample,
                                                 const std::shared_ptr<RandomSource>& random) {
    if (!subsample.has_mechanism())
        throw std::invalid_argument("a subsample policy needs a nested mechanism");

    std::vector<Eigen::Index> dataSize(subsample.data_size().begin(), subsample.data_size().end());
    auto mechanism = buildAccessDefinition(subsample.mechanism(), random);

    if (subsample.with_replacement())
        return std::make_shared<SampleWithReplacement>(mechanism, subsample.sample_size(), dataSize, random);
    return std::make_shared<SampleWithoutReplacement>(mechanism, subsample.sample_size(), dataSize, random);
}

}

std::shared_ptr<AccessDefinition> buildAccessDefinition(const dp_access::AccessPolicy& policy,
                                                        const std::shared_ptr<RandomSource>& random) {
    switch (policy.variant_case()) {
        case dp_access::AccessPolicy::kUnprotected:
            return std::make_shared<UnprotectedAccess>();

        case dp_access::AccessPolicy::kLaplace:
            return std::make_shared<LaplaceMechanism>(
                    policy.laplace().sensitivity(), policy.laplace().epsilon(), random);

        case dp_access::AccessPolicy::kGaussian: {
            if (!policy.gaussian().has_epsilon_delta())
                throw std::invalid_argument("a gaussian policy needs an epsilon delta");
            return std::make_shared<GaussianMechanism>(
                    policy.gaussian().sensitivity(), toPrivacyBudget(policy.gaussian().epsilon_delta()), random);
        }

        case dp_access::AccessPolicy::kRandomizedResponseCoins: {
            const auto& coins = policy.randomized_response_coins();
            double probHeadFirst = coins.first_coin_case() == dp_access::RandomizedResponseCoins::kProbHeadFirst
                                   ? coins.prob_head_first() : 0.5;
            double probHeadSecond = coins.second_coin_case() == dp_access::RandomizedResponseCoins::kProbHeadSecond
                                    ? coins.prob_head_second() : 0.5;
            return std::make_shared<RandomizedResponseCoins>(probHeadFirst, probHeadSecond, random);
        }

        case dp_access::AccessPolicy::kRandomizedResponseBinary: {
            const auto& binary = policy.randomized_response_binary();
            return std::make_shared<RandomizedResponseBinary>(binary.f0(), binary.f1(), binary.epsilon(), random);
        }

        case dp_access::AccessPolicy::kSubsample:
            return buildSubsample(policy.subsample(), random);

        case dp_access::AccessPolicy::kAdaptive: {
            const auto& adaptive = policy.adaptive();
            if (!adaptive.has_budget())
                throw std::invalid_argument("an adaptive policy needs a global budget");
            std::shared_ptr<AccessDefinition> defaultMechanism;
            if (adaptive.has_default_mechanism())
                defaultMechanism = buildAccessDefinition(adaptive.default_mechanism(), random);
            return std::make_shared<AdaptiveDifferentialPrivacy>(toPrivacyBudget(adaptive.budget()), defaultMechanism);
        }

        case dp_access::AccessPolicy::VARIANT_NOT_SET:
            break;
    }
    throw std::invalid_argument("access policy has no variant set");
}

bool validatePolicy(const dp_access::AccessPolicy& policy) {
    try {
        buildAccessDefinition(policy);
    } catch (const std::logic_error& error) {
        logMessage(logInfo, "invalid access policy: %s", error.what());
        return false;
    }
    return true;
}

dp_access::PrivacyUsage computePrivacyUsage(const dp_access::AccessPolicy& policy) {
    auto definition = buildAccessDefinition(policy);

    dp_access::PrivacyUsage usage;
    usage.set_variant(definition->get_name());

    auto dpDefinition = asDifferentiallyPrivate(definition);
    usage.set_differentially_private(dpDefinition != nullptr);
    if (dpDefinition) {
        PrivacyBudget epsilonDelta = dpDefinition->get_epsilon_delta();
        usage.mutable_epsilon_delta()->set_epsilon(epsilonDelta.get_epsilon());
        usage.mutable_epsilon_delta()->set_delta(epsilonDelta.get_delta());
    }
    return usage;
}
