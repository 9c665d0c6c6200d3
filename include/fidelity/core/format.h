#pragma once

namespace fidelity {

enum class Format { Markup, ObjectNotation };

inline const char* format_name(Format format) {
    switch (format) {
        case Format::Markup:         return "xml";
        case Format::ObjectNotation: return "json";
    }
    return "unknown";
}

} // namespace fidelity
