#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace fidelity::text {

// A substring shaped like a named reference: '&', one or more ASCII letters or
// digits, ';'. The view points into the scanned text.
struct TokenMatch {
    size_t offset = 0;
    size_t length = 0;
    std::string_view text;

    std::string_view name() const { return text.substr(1, text.size() - 2); }
};

// ASCII only, independent of the process locale
inline bool is_entity_name_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

// Visits every leftmost, non-overlapping match in one forward pass.
template<typename Fn>
void for_each_entity_token(std::string_view text, Fn&& fn) {
    size_t pos = text.find('&');
    while (pos != std::string_view::npos) {
        size_t end = pos + 1;
        while (end < text.size() && is_entity_name_char(text[end])) {
            ++end;
        }
        if (end > pos + 1 && end < text.size() && text[end] == ';') {
            fn(TokenMatch{pos, end + 1 - pos, text.substr(pos, end + 1 - pos)});
            pos = text.find('&', end + 1);
        } else {
            // The run between pos and end holds no '&', so resume at end.
            pos = text.find('&', end);
        }
    }
}

std::vector<TokenMatch> find_entity_tokens(std::string_view text);

// Rewrites every named reference found in EntityTable to its numeric form.
// Everything else, including &amp; &lt; &gt; &quot; &apos; and unknown
// names, is copied byte for byte. Never fails.
std::string sanitize_markup(std::string_view text);

} // namespace fidelity::text
