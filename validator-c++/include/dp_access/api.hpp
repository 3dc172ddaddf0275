#ifndef DP_ACCESS_API_HPP
#define DP_ACCESS_API_HPP

#include <cstddef>
#include <access_policy.pb.h>

// policies are passed as serialized dp_access.AccessPolicy buffers
extern "C" {
    unsigned int validate_access_policy(char* policyBuffer, size_t policyLength);
    // negative if the policy is malformed, infinite if it is not differentially private
    double compute_epsilon(char* policyBuffer, size_t policyLength);
    // json of the privacy usage, null if the policy is malformed
    char* generate_report(char* policyBuffer, size_t policyLength);

    // for deallocating pointers to malloc'ed char arrays
    void free_ptr(char* ptr);
}

#endif //DP_ACCESS_API_HPP
