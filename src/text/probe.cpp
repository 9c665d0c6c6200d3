#include <fidelity/text/probe.h>
#include <cctype>

namespace fidelity::text {

namespace {

std::string_view trim_start(std::string_view text) {
    size_t i = 0;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
        ++i;
    }
    return text.substr(i);
}

} // namespace

bool probe_is_markup(std::string_view text) {
    std::string_view trimmed = trim_start(text);
    if (trimmed.size() < 3 || trimmed[0] != '<') return false;

    size_t close = trimmed.find('>', 1);
    return close != std::string_view::npos && close > 1;
}

bool probe_is_object_notation(std::string_view text) {
    std::string_view trimmed = trim_start(text);
    return !trimmed.empty() && trimmed[0] == '{';
}

std::optional<Format> probe_format(std::string_view text) {
    if (probe_is_markup(text)) return Format::Markup;
    if (probe_is_object_notation(text)) return Format::ObjectNotation;
    return std::nullopt;
}

} // namespace fidelity::text
