#include <fidelity/core/utf8.h>

namespace fidelity::utf8 {

void append(std::string& out, char32_t codepoint) {
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

std::optional<char32_t> next_code_point(std::string_view text, size_t& pos) {
    if (pos >= text.size()) return std::nullopt;

    auto lead = static_cast<unsigned char>(text[pos]);
    if (lead < 0x80) {
        ++pos;
        return static_cast<char32_t>(lead);
    }

    size_t length = 0;
    char32_t codepoint = 0;
    char32_t minimum = 0;
    if ((lead & 0xE0) == 0xC0) {
        length = 2; codepoint = lead & 0x1F; minimum = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3; codepoint = lead & 0x0F; minimum = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4; codepoint = lead & 0x07; minimum = 0x10000;
    } else {
        return std::nullopt;
    }

    if (pos + length > text.size()) return std::nullopt;
    for (size_t i = 1; i < length; ++i) {
        auto cont = static_cast<unsigned char>(text[pos + i]);
        if ((cont & 0xC0) != 0x80) return std::nullopt;
        codepoint = (codepoint << 6) | (cont & 0x3F);
    }

    if (codepoint < minimum || codepoint > 0x10FFFF || is_surrogate(codepoint)) {
        return std::nullopt;
    }
    pos += length;
    return codepoint;
}

size_t find_invalid(std::string_view text) {
    size_t pos = 0;
    while (pos < text.size()) {
        // ASCII fast path
        if (static_cast<unsigned char>(text[pos]) < 0x80) {
            ++pos;
            continue;
        }
        if (!next_code_point(text, pos)) return pos;
    }
    return std::string_view::npos;
}

std::string_view strip_byte_order_mark(std::string_view text) {
    if (text.compare(0, kByteOrderMark.size(), kByteOrderMark) == 0) {
        text.remove_prefix(kByteOrderMark.size());
    }
    return text;
}

} // namespace fidelity::utf8
