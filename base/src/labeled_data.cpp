#include "../include/dp_access/labeled_data.hpp"

#include <utility>

LabeledData::LabeledData(RuntimeValue data, RuntimeValue label)
        : _data{std::move(data)}, _label{std::move(label)} {}

const RuntimeValue& LabeledData::get_data() const {
    return this->_data;
}

void LabeledData::set_data(const RuntimeValue& data) {
    this->_data = data;
}

const RuntimeValue& LabeledData::get_label() const {
    return this->_label;
}

void LabeledData::set_label(const RuntimeValue& label) {
    this->_label = label;
}
