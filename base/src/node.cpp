#include "../include/dp_access/node.hpp"
#include "../include/dp_access/logging.hpp"

#include <stdexcept>

void DataNode::set_private_data(const std::string& name, const RuntimeValue& data) {
    if (this->_private_data.find(name) != this->_private_data.end())
        logMessage(logInfo, "replacing private data '%s'", name.c_str());
    this->_private_data[name] = data;
}

void DataNode::configure_data_access(const std::string& name,
                                     const std::shared_ptr<AccessDefinition>& accessDefinition) {
    if (!accessDefinition)
        throw std::invalid_argument("an access definition is required to configure '" + name + "'");
    if (!this->has_private_data(name))
        throw std::invalid_argument("no private data named '" + name + "'");

    logMessage(logInfo, "configuring %s access for '%s'", accessDefinition->get_name().c_str(), name.c_str());
    this->_private_data_access_policies[name] = accessDefinition;
}

RuntimeValue DataNode::query(const std::string& name,
                             const std::shared_ptr<AccessDefinition>& accessDefinition) const {
    auto data = this->_private_data.find(name);
    if (data == this->_private_data.end())
        throw std::invalid_argument("no private data named '" + name + "'");

    auto policy = this->_private_data_access_policies.find(name);
    if (policy == this->_private_data_access_policies.end())
        throw std::invalid_argument("no access definition configured for '" + name + "'");

    if (accessDefinition)
        return policy->second->apply_with_mechanism(data->second, accessDefinition);
    return policy->second->apply(data->second);
}

bool DataNode::has_private_data(const std::string& name) const {
    return this->_private_data.find(name) != this->_private_data.end();
}

std::vector<std::string> DataNode::get_private_data_names() const {
    std::vector<std::string> names;
    for (const auto& dataPair : this->_private_data)
        names.push_back(dataPair.first);
    return names;
}
