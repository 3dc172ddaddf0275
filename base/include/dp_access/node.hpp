#ifndef DP_ACCESS_NODE_HPP
#define DP_ACCESS_NODE_HPP

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "access.hpp"
#include "value.hpp"

// a protocol participant, its private data is only readable through the
// access definition configured for each property
class DataNode {
    std::map<std::string, RuntimeValue> _private_data;
    std::map<std::string, std::shared_ptr<AccessDefinition>> _private_data_access_policies;

public:
    // rebinding an existing name replaces the value and keeps its access definition
    void set_private_data(const std::string& name, const RuntimeValue& data);
    void configure_data_access(const std::string& name, const std::shared_ptr<AccessDefinition>& accessDefinition);

    RuntimeValue query(const std::string& name,
                       const std::shared_ptr<AccessDefinition>& accessDefinition = nullptr) const;

    bool has_private_data(const std::string& name) const;
    std::vector<std::string> get_private_data_names() const;
};

#endif //DP_ACCESS_NODE_HPP
