#include <fidelity/core/error.h>

namespace fidelity {

namespace {

std::string compose_message(const std::string& prefix, const std::string& detail, Position where) {
    std::string message = prefix.empty() ? detail : prefix + ": " + detail;
    if (where.known()) {
        message += " (line " + std::to_string(where.line) +
                   ", column " + std::to_string(where.column) + ")";
    }
    return message;
}

} // namespace

FormatError::FormatError(const std::string& prefix, const std::string& detail, Position where)
    : Error(compose_message(prefix, detail, where))
    , detail_(detail)
    , where_(where) {}

} // namespace fidelity
