#include <fidelity/text/sanitizer.h>
#include <fidelity/text/entity_table.h>

namespace fidelity::text {

std::vector<TokenMatch> find_entity_tokens(std::string_view text) {
    std::vector<TokenMatch> matches;
    for_each_entity_token(text, [&](const TokenMatch& m) {
        matches.push_back(m);
    });
    return matches;
}

std::string sanitize_markup(std::string_view text) {
    if (text.empty()) return std::string();

    const EntityTable& table = EntityTable::instance();
    std::string result;
    size_t flushed = 0;
    bool replaced = false;

    for_each_entity_token(text, [&](const TokenMatch& m) {
        auto reference = table.lookup(m.name());
        if (!reference) return;

        if (!replaced) {
            // Numeric references are at most 4 bytes longer than the name form.
            result.reserve(text.size() + text.size() / 8);
            replaced = true;
        }
        result.append(text, flushed, m.offset - flushed);
        result.append(*reference);
        flushed = m.offset + m.length;
    });

    if (!replaced) return std::string(text);

    result.append(text, flushed, std::string_view::npos);
    return result;
}

} // namespace fidelity::text
