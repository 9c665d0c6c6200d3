#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace fidelity::utf8 {

void append(std::string& out, char32_t codepoint);

// Decodes the sequence starting at pos and advances pos past it. Overlong
// forms, surrogates and values above U+10FFFF are rejected (pos unchanged).
std::optional<char32_t> next_code_point(std::string_view text, size_t& pos);

// Offset of the first byte that does not start a valid sequence, or npos.
size_t find_invalid(std::string_view text);

// XML 1.0 Char production.
inline bool is_xml_char(char32_t c) {
    return c == 0x9 || c == 0xA || c == 0xD ||
           (c >= 0x20 && c <= 0xD7FF) ||
           (c >= 0xE000 && c <= 0xFFFD) ||
           (c >= 0x10000 && c <= 0x10FFFF);
}

inline bool is_surrogate(char32_t c) { return c >= 0xD800 && c <= 0xDFFF; }

inline constexpr std::string_view kByteOrderMark = "\xEF\xBB\xBF";

// text without a leading byte order mark
std::string_view strip_byte_order_mark(std::string_view text);

} // namespace fidelity::utf8
