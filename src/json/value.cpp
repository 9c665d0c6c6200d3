#include <fidelity/json/value.h>

namespace fidelity::json {

const char* value_type_name(ValueType type) {
    switch (type) {
        case ValueType::Null:    return "null";
        case ValueType::Boolean: return "boolean";
        case ValueType::Number:  return "number";
        case ValueType::String:  return "string";
        case ValueType::Array:   return "array";
        case ValueType::Object:  return "object";
    }
    return "unknown";
}

ValueType Value::type() const {
    switch (data_.index()) {
        case 1: return ValueType::Boolean;
        case 2: return ValueType::Number;
        case 3: return ValueType::String;
        case 4: return ValueType::Array;
        case 5: return ValueType::Object;
        default: return ValueType::Null;
    }
}

void Value::type_mismatch(ValueType wanted) const {
    throw Error(std::string("json value is ") + value_type_name(type()) +
                ", not " + value_type_name(wanted));
}

bool Value::as_bool() const {
    if (!is_bool()) type_mismatch(ValueType::Boolean);
    return std::get<bool>(data_);
}

const Decimal& Value::as_decimal() const {
    if (!is_number()) type_mismatch(ValueType::Number);
    return std::get<Decimal>(data_);
}

const std::string& Value::as_string() const {
    if (!is_string()) type_mismatch(ValueType::String);
    return std::get<std::string>(data_);
}

const Value::Array& Value::as_array() const {
    if (!is_array()) type_mismatch(ValueType::Array);
    return std::get<Array>(data_);
}

Value::Array& Value::as_array() {
    if (!is_array()) type_mismatch(ValueType::Array);
    return std::get<Array>(data_);
}

const Value::Object& Value::as_object() const {
    if (!is_object()) type_mismatch(ValueType::Object);
    return std::get<Object>(data_);
}

Value::Object& Value::as_object() {
    if (!is_object()) type_mismatch(ValueType::Object);
    return std::get<Object>(data_);
}

const Value* Value::find(std::string_view name) const {
    if (!is_object()) return nullptr;
    for (auto& member : std::get<Object>(data_)) {
        if (member.first == name) return &member.second;
    }
    return nullptr;
}

Value* Value::find(std::string_view name) {
    if (!is_object()) return nullptr;
    for (auto& member : std::get<Object>(data_)) {
        if (member.first == name) return &member.second;
    }
    return nullptr;
}

Value& Value::set(const std::string& name, Value value) {
    if (Value* existing = find(name)) {
        *existing = std::move(value);
        return *existing;
    }
    auto& members = as_object();
    members.emplace_back(name, std::move(value));
    return members.back().second;
}

Value& Value::push_back(Value value) {
    auto& items = as_array();
    items.push_back(std::move(value));
    return items.back();
}

size_t Value::size() const {
    if (is_array()) return std::get<Array>(data_).size();
    if (is_object()) return std::get<Object>(data_).size();
    return 0;
}

} // namespace fidelity::json
