#include "access_policy.pb.h"

#include <cstdlib>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

#include <google/protobuf/util/json_util.h>

#include "../include/dp_access/api.hpp"
#include "../include/dp_access/policy.hpp"
#include <dp_access/logging.hpp>

namespace {

bool parsePolicy(char* policyBuffer, size_t policyLength, dp_access::AccessPolicy& policy) {
    std::string policyString(policyBuffer, policyLength);
    if (!policy.ParseFromString(policyString)) {
        logMessage(logError, "could not parse access policy buffer of %zu bytes", policyLength);
        return false;
    }
    return true;
}

}

unsigned int validate_access_policy(char* policyBuffer, size_t policyLength) {
    dp_access::AccessPolicy policy;
    if (!parsePolicy(policyBuffer, policyLength, policy)) return false;
    return validatePolicy(policy);
}

double compute_epsilon(char* policyBuffer, size_t policyLength) {
    dp_access::AccessPolicy policy;
    if (!parsePolicy(policyBuffer, policyLength, policy)) return -1;

    dp_access::PrivacyUsage usage;
    try {
        usage = computePrivacyUsage(policy);
    } catch (const std::logic_error& error) {
        logMessage(logError, "compute_epsilon: %s", error.what());
        return -1;
    }

    if (!usage.differentially_private())
        return std::numeric_limits<double>::infinity();
    return usage.epsilon_delta().epsilon();
}

char* generate_report(char* policyBuffer, size_t policyLength) {
    dp_access::AccessPolicy policy;
    if (!parsePolicy(policyBuffer, policyLength, policy)) return nullptr;

    dp_access::PrivacyUsage usage;
    try {
        usage = computePrivacyUsage(policy);
    } catch (const std::logic_error& error) {
        logMessage(logError, "generate_report: %s", error.what());
        return nullptr;
    }

    std::string report;
    google::protobuf::util::JsonPrintOptions options;
    options.always_print_primitive_fields = true;
    auto status = google::protobuf::util::MessageToJsonString(usage, &report, options);
    if (!status.ok()) {
        logMessage(logError, "generate_report: %s", status.ToString().c_str());
        return nullptr;
    }

    // invokes malloc for a string duplicate to preserve memory after this stack frame popped
    return strdup(report.c_str());
}

void free_ptr(char* ptr) {
    free(ptr);
}
