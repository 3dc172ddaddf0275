#include "../include/dp_access/federated.hpp"
#include "../include/dp_access/logging.hpp"

#include <stdexcept>
#include <utility>

void IdentifierRegistry::reserve(const std::string& identifier) {
    if (!this->_used_identifiers.insert(identifier).second)
        throw std::invalid_argument("Identifier " + identifier + " is already in use");
}

bool IdentifierRegistry::contains(const std::string& identifier) const {
    return this->_used_identifiers.find(identifier) != this->_used_identifiers.end();
}

FederatedData::FederatedData(IdentifierRegistry& registry, std::string identifier)
        : _identifier{std::move(identifier)} {
    registry.reserve(this->_identifier);
}

const std::string& FederatedData::get_identifier() const {
    return this->_identifier;
}

void FederatedData::add_data_node(const std::shared_ptr<DataNode>& node, const RuntimeValue& data) {
    if (!node)
        throw std::invalid_argument("cannot add a null data node to " + this->_identifier);
    node->set_private_data(this->_identifier, data);
    this->_data_nodes.push_back(node);
}

size_t FederatedData::num_nodes() const {
    return this->_data_nodes.size();
}

const std::shared_ptr<DataNode>& FederatedData::operator[](size_t index) const {
    return this->_data_nodes.at(index);
}

std::vector<std::shared_ptr<DataNode>>::const_iterator FederatedData::begin() const {
    return this->_data_nodes.begin();
}

std::vector<std::shared_ptr<DataNode>>::const_iterator FederatedData::end() const {
    return this->_data_nodes.end();
}

void FederatedData::configure_data_access(const std::shared_ptr<AccessDefinition>& accessDefinition) {
    for (const auto& node : this->_data_nodes)
        node->configure_data_access(this->_identifier, accessDefinition);
}

void FederatedData::configure_data_access(const AccessDefinitionFactory& factory) {
    for (const auto& node : this->_data_nodes)
        node->configure_data_access(this->_identifier, factory());
}

std::vector<RuntimeValue> FederatedData::query(const std::shared_ptr<AccessDefinition>& accessDefinition) const {
    std::vector<RuntimeValue> results;
    results.reserve(this->_data_nodes.size());
    for (const auto& node : this->_data_nodes)
        results.push_back(node->query(this->_identifier, accessDefinition));
    return results;
}

FederatedData federateArray(IdentifierRegistry& registry, const std::string& identifier,
                            const RuntimeValue& array, size_t numDataNodes) {
    if (array.getDatatype() == typeScalarNumeric)
        throw std::invalid_argument("cannot federate a scalar value");
    auto rows = static_cast<size_t>(array.rows());
    if (numDataNodes == 0 || numDataNodes > rows)
        throw std::invalid_argument("cannot split " + std::to_string(rows) + " records across " +
                                    std::to_string(numDataNodes) + " nodes");

    FederatedData federatedData(registry, identifier);
    for (size_t node = 0; node < numDataNodes; ++node) {
        size_t first = node * rows / numDataNodes;
        size_t last = (node + 1) * rows / numDataNodes;

        std::vector<Eigen::Index> indices;
        for (size_t row = first; row < last; ++row)
            indices.push_back(static_cast<Eigen::Index>(row));
        federatedData.add_data_node(std::make_shared<DataNode>(), array.selectRows(indices));
    }

    logMessage(logDebug, "federated %zu records of '%s' across %zu nodes", rows, identifier.c_str(), numDataNodes);
    return federatedData;
}
