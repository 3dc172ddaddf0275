#ifndef DP_ACCESS_LABELED_DATA_HPP
#define DP_ACCESS_LABELED_DATA_HPP

#include "value.hpp"

// a node's training payload
class LabeledData {
    RuntimeValue _data;
    RuntimeValue _label;
public:
    explicit LabeledData(RuntimeValue data, RuntimeValue label);

    const RuntimeValue& get_data() const;
    void set_data(const RuntimeValue& data);

    const RuntimeValue& get_label() const;
    void set_label(const RuntimeValue& label);
};

#endif //DP_ACCESS_LABELED_DATA_HPP
