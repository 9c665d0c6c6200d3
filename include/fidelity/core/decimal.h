#pragma once
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace fidelity {

// Arbitrary-precision decimal kept as the exact literal it was read from.
// "1.50" stays "1.50": scale and trailing zeros are part of the value, and
// nothing is routed through binary floating point.
class Decimal {
public:
    Decimal() : text_("0") {}
    explicit Decimal(int64_t value) : text_(std::to_string(value)) {}

    // Accepts the JSON number grammar: -?(0|[1-9]\d*)(\.\d+)?([eE][+-]?\d+)?
    static std::optional<Decimal> parse(std::string_view text);

    // Same as parse() but throws FormatError on malformed text.
    static Decimal from_string(std::string_view text);

    static bool is_valid_literal(std::string_view text);

    const std::string& text() const { return text_; }
    std::string to_string() const { return text_; }

    // Digits after the decimal point, adjusted by the exponent, clamped to
    // [0, INT_MAX] however large the exponent is.
    int scale() const;
    bool is_integer() const;
    bool is_negative() const { return !text_.empty() && text_[0] == '-'; }

    // Lossy; for callers that explicitly want a binary approximation.
    double to_double() const;

    bool operator==(const Decimal& other) const { return text_ == other.text_; }
    bool operator!=(const Decimal& other) const { return text_ != other.text_; }

private:
    explicit Decimal(std::string text) : text_(std::move(text)) {}

    std::string text_;
};

std::ostream& operator<<(std::ostream& os, const Decimal& value);

} // namespace fidelity
