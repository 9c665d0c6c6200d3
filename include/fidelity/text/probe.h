#pragma once
#include <fidelity/core/format.h>
#include <optional>
#include <string_view>

namespace fidelity::text {

// Dispatch heuristics only. A true result does not mean the input is well
// formed; the readers decide that.

// Leading whitespace, then '<', one or more characters other than '>', '>'.
bool probe_is_markup(std::string_view text);

// Leading whitespace, then '{'.
bool probe_is_object_notation(std::string_view text);

std::optional<Format> probe_format(std::string_view text);

} // namespace fidelity::text
