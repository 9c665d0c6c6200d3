#include <fidelity/core/decimal.h>
#include <fidelity/core/error.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>

namespace fidelity {

namespace {

constexpr int64_t kScaleLimit = int64_t{1} << 40;

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

} // namespace

bool Decimal::is_valid_literal(std::string_view text) {
    size_t i = 0;
    const size_t n = text.size();

    if (i < n && text[i] == '-') ++i;
    if (i >= n) return false;

    // Integer part: a single zero or a non-zero-led run
    if (text[i] == '0') {
        ++i;
    } else if (is_digit(text[i])) {
        while (i < n && is_digit(text[i])) ++i;
    } else {
        return false;
    }

    if (i < n && text[i] == '.') {
        ++i;
        size_t start = i;
        while (i < n && is_digit(text[i])) ++i;
        if (i == start) return false;
    }

    if (i < n && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        if (i < n && (text[i] == '+' || text[i] == '-')) ++i;
        size_t start = i;
        while (i < n && is_digit(text[i])) ++i;
        if (i == start) return false;
    }

    return i == n;
}

std::optional<Decimal> Decimal::parse(std::string_view text) {
    if (!is_valid_literal(text)) return std::nullopt;
    return Decimal(std::string(text));
}

Decimal Decimal::from_string(std::string_view text) {
    auto parsed = parse(text);
    if (!parsed) {
        throw FormatError("Invalid decimal", "'" + std::string(text) + "' is not a decimal literal");
    }
    return *parsed;
}

int Decimal::scale() const {
    size_t dot = text_.find('.');
    size_t exp = text_.find_first_of("eE");

    int64_t fraction_digits = 0;
    if (dot != std::string::npos) {
        size_t end = (exp == std::string::npos) ? text_.size() : exp;
        fraction_digits = static_cast<int64_t>(std::min<size_t>(end - dot - 1, kScaleLimit));
    }

    // The exponent saturates at kScaleLimit, well inside int64_t
    int64_t exponent = 0;
    if (exp != std::string::npos) {
        size_t i = exp + 1;
        bool negative = false;
        if (text_[i] == '+' || text_[i] == '-') {
            negative = text_[i] == '-';
            ++i;
        }
        for (; i < text_.size() && exponent < kScaleLimit; ++i) {
            exponent = exponent * 10 + (text_[i] - '0');
        }
        exponent = std::min(exponent, kScaleLimit);
        if (negative) exponent = -exponent;
    }

    int64_t result = fraction_digits - exponent;
    return static_cast<int>(std::clamp<int64_t>(result, 0, std::numeric_limits<int>::max()));
}

bool Decimal::is_integer() const {
    return text_.find_first_of(".eE") == std::string::npos;
}

double Decimal::to_double() const {
    return std::strtod(text_.c_str(), nullptr);
}

std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.text();
}

} // namespace fidelity
