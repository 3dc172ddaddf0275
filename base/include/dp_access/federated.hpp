#ifndef DP_ACCESS_FEDERATED_HPP
#define DP_ACCESS_FEDERATED_HPP

#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "access.hpp"
#include "node.hpp"
#include "value.hpp"

// dataset identifiers already claimed by federated data
class IdentifierRegistry {
    std::set<std::string> _used_identifiers;
public:
    void reserve(const std::string& identifier);
    bool contains(const std::string& identifier) const;
};

typedef std::function<std::shared_ptr<AccessDefinition>()> AccessDefinitionFactory;

// data across different nodes, bound under one identifier on every node
class FederatedData {
    std::string _identifier;
    std::vector<std::shared_ptr<DataNode>> _data_nodes;
public:
    explicit FederatedData(IdentifierRegistry& registry, std::string identifier);

    FederatedData(const FederatedData&) = delete;
    FederatedData& operator=(const FederatedData&) = delete;
    FederatedData(FederatedData&&) = default;
    FederatedData& operator=(FederatedData&&) = default;

    const std::string& get_identifier() const;

    void add_data_node(const std::shared_ptr<DataNode>& node, const RuntimeValue& data);
    size_t num_nodes() const;

    const std::shared_ptr<DataNode>& operator[](size_t index) const;
    std::vector<std::shared_ptr<DataNode>>::const_iterator begin() const;
    std::vector<std::shared_ptr<DataNode>>::const_iterator end() const;

    // every node shares the same instance
    void configure_data_access(const std::shared_ptr<AccessDefinition>& accessDefinition);
    // every node gets its own instance, required for stateful privacy filters
    void configure_data_access(const AccessDefinitionFactory& factory);

    // per node results, in insertion order
    std::vector<RuntimeValue> query(const std::shared_ptr<AccessDefinition>& accessDefinition = nullptr) const;
};

// splits the records of an array into contiguous chunks, one per node
FederatedData federateArray(IdentifierRegistry& registry, const std::string& identifier,
                            const RuntimeValue& array, size_t numDataNodes);

#endif //DP_ACCESS_FEDERATED_HPP
