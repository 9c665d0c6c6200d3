#pragma once
#include <fidelity/json/value.h>
#include <cstddef>
#include <string>
#include <string_view>

namespace fidelity::json {

inline constexpr const char kErrorPrefix[] = "Cannot parse json";

// Recursive-descent parser for one JSON object document.
//
// - // and /* */ comments are skipped wherever whitespace is allowed
// - numbers are validated and kept as Decimal text
// - date-like strings are left as strings
// - the root must be an object; duplicate names and trailing content fail
class Parser {
public:
    explicit Parser(std::string_view input);

    Value parse_document();

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;

    char peek() const { return pos_ < input_.size() ? input_[pos_] : '\0'; }
    char consume();
    bool at_end() const { return pos_ >= input_.size(); }
    Position position() const { return {line_, column_}; }

    void skip_whitespace_and_comments();

    Value parse_value(size_t depth);
    Value parse_object(size_t depth);
    Value parse_array(size_t depth);
    std::string parse_string();
    Value parse_number();
    Value parse_literal();
    char32_t parse_hex_escape();

    [[noreturn]] void fail(const std::string& message) const;
    [[noreturn]] void fail(const std::string& message, Position where) const;
};

Value parse_document(std::string_view text);

} // namespace fidelity::json
