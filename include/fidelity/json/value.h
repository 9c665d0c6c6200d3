#pragma once
#include <fidelity/core/decimal.h>
#include <fidelity/core/error.h>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace fidelity::json {

enum class ValueType { Null, Boolean, Number, String, Array, Object };

const char* value_type_name(ValueType type);

// Generic object-notation tree. Numbers are Decimal, never double; object
// members keep document order; every value remembers where it started.
class Value {
public:
    using Array = std::vector<Value>;
    using Object = std::vector<std::pair<std::string, Value>>;

    Value() : data_(std::monostate{}) {}
    Value(std::nullptr_t) : data_(std::monostate{}) {}
    Value(bool b) : data_(b) {}
    Value(Decimal d) : data_(std::move(d)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(Array a) : data_(std::move(a)) {}
    Value(Object o) : data_(std::move(o)) {}

    static Value array() { return Value(Array{}); }
    static Value object() { return Value(Object{}); }

    ValueType type() const;

    bool is_null() const { return std::holds_alternative<std::monostate>(data_); }
    bool is_bool() const { return std::holds_alternative<bool>(data_); }
    bool is_number() const { return std::holds_alternative<Decimal>(data_); }
    bool is_string() const { return std::holds_alternative<std::string>(data_); }
    bool is_array() const { return std::holds_alternative<Array>(data_); }
    bool is_object() const { return std::holds_alternative<Object>(data_); }

    // Typed access; throws fidelity::Error on a type mismatch
    bool as_bool() const;
    const Decimal& as_decimal() const;
    const std::string& as_string() const;
    const Array& as_array() const;
    Array& as_array();
    const Object& as_object() const;
    Object& as_object();

    // Object helpers
    const Value* find(std::string_view name) const;
    Value* find(std::string_view name);
    bool contains(std::string_view name) const { return find(name) != nullptr; }
    // Replaces an existing member or appends a new one
    Value& set(const std::string& name, Value value);

    // Array helper
    Value& push_back(Value value);

    // Element count for arrays, member count for objects, 0 otherwise
    size_t size() const;

    Position position() const { return position_; }
    void set_position(Position position) { position_ = position; }

    // Structural comparison; positions are ignored and decimals compare by text
    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    std::variant<std::monostate, bool, Decimal, std::string, Array, Object> data_;
    Position position_;

    [[noreturn]] void type_mismatch(ValueType wanted) const;
};

} // namespace fidelity::json
