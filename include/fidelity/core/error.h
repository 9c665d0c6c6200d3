#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace fidelity {

struct Position {
    size_t line = 0;    // 1-based, 0 when unknown
    size_t column = 0;

    bool known() const { return line != 0; }
};

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Malformed markup or object notation. detail() is the parser's own message,
// what() adds the format prefix and the location.
class FormatError : public Error {
public:
    FormatError(const std::string& prefix, const std::string& detail, Position where = {});

    const std::string& detail() const { return detail_; }
    Position position() const { return where_; }
    size_t line() const { return where_.line; }
    size_t column() const { return where_.column; }

private:
    std::string detail_;
    Position where_;
};

// DOCTYPE and entity declarations. Always fatal.
class SecurityRejected : public FormatError {
public:
    SecurityRejected(const std::string& prefix, const std::string& detail, Position where = {})
        : FormatError(prefix, detail, where) {}
};

class IoError : public Error {
public:
    explicit IoError(const std::string& message) : Error(message) {}
};

} // namespace fidelity
