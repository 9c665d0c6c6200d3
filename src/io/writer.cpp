#include <fidelity/io/writer.h>
#include <fidelity/core/error.h>
#include <fidelity/core/utf8.h>
#include <fidelity/xml/tokenizer.h>
#include <algorithm>
#include <cstdio>
#include <ios>

namespace fidelity::io {

namespace {

std::string hex_escape(const char* format, unsigned value) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), format, value);
    return buf;
}

} // namespace

// ---------------------------------------------------------------------------
// Writer
// ---------------------------------------------------------------------------

void Writer::fail(const std::string& message) const {
    throw FormatError(kWriterErrorPrefix, message);
}

void Writer::check_writable() const {
    if (closed_) {
        fail("writer is already closed");
    }
}

void Writer::emit(std::string_view text) {
    sink_.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (sink_.bad()) {
        throw IoError("Failed to write to output stream");
    }
}

void Writer::emit(char c) {
    emit(std::string_view(&c, 1));
}

void Writer::flush() {
    sink_.flush();
    if (!sink_) {
        throw IoError("Failed to flush output stream");
    }
}

void Writer::close() {
    if (closed_) return;
    check_complete();
    flush();
    closed_ = true;
}

void Writer::release() noexcept {
    closed_ = true;
    try {
        sink_.flush();
    } catch (const std::ios_base::failure&) {
        // Only reached while another exception is already propagating
    }
}

// ---------------------------------------------------------------------------
// MarkupWriter
// ---------------------------------------------------------------------------

void MarkupWriter::check_name(std::string_view name, const char* what) const {
    bool valid = !name.empty() && xml::is_name_start_char(static_cast<unsigned char>(name[0])) &&
        std::all_of(name.begin() + 1, name.end(),
            [](char c) { return xml::is_name_char(static_cast<unsigned char>(c)); });
    if (!valid) {
        fail("'" + std::string(name) + "' is not a valid " + what + " name");
    }
}

char32_t MarkupWriter::next_xml_char(std::string_view text, size_t& pos, const char* context) const {
    auto codepoint = utf8::next_code_point(text, pos);
    if (!codepoint) {
        fail(std::string("invalid UTF-8 byte sequence in ") + context);
    }
    if (!utf8::is_xml_char(*codepoint)) {
        fail("character " + hex_escape("U+%04X", static_cast<unsigned>(*codepoint)) +
             " in " + context + " cannot be represented in XML");
    }
    return *codepoint;
}

void MarkupWriter::emit_escaped(std::string_view text, bool in_attribute) {
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        char32_t c = next_xml_char(text, pos, in_attribute ? "attribute" : "text");

        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '\r': out += "&#xD;"; break;
            case '\n': out += "&#xA;"; break;
            case '"':
                if (in_attribute) out += "&quot;"; else out += '"';
                break;
            case '\t':
                if (in_attribute) out += "&#x9;"; else out += '\t';
                break;
            default:
                utf8::append(out, c);
                break;
        }
    }
    emit(out);
}

void MarkupWriter::close_start_tag() {
    if (!start_tag_open_) return;
    emit('>');
    start_tag_open_ = false;
    pending_attributes_.clear();
}

void MarkupWriter::write_start_element(std::string_view name) {
    check_writable();
    check_name(name, "element");
    if (open_elements_.empty() && root_written_) {
        fail("document already has a root element, cannot start '" + std::string(name) + "'");
    }

    close_start_tag();
    emit('<');
    emit(name);
    open_elements_.emplace_back(name);
    start_tag_open_ = true;
    root_written_ = true;
}

void MarkupWriter::write_attribute(std::string_view name, std::string_view value) {
    check_writable();
    if (!start_tag_open_) {
        fail("attribute '" + std::string(name) + "' written outside a start tag");
    }
    check_name(name, "attribute");
    if (std::find(pending_attributes_.begin(), pending_attributes_.end(), name) != pending_attributes_.end()) {
        fail("duplicate attribute '" + std::string(name) + "'");
    }
    pending_attributes_.emplace_back(name);

    emit(' ');
    emit(name);
    emit("=\"");
    emit_escaped(value, true);
    emit('"');
}

void MarkupWriter::write_string(std::string_view text) {
    check_writable();
    if (open_elements_.empty()) {
        fail("text cannot be written outside the root element");
    }
    close_start_tag();
    emit_escaped(text, false);
}

void MarkupWriter::write_comment(std::string_view text) {
    check_writable();
    if (text.find("--") != std::string_view::npos || (!text.empty() && text.back() == '-')) {
        fail("comment text cannot contain '--' or end with '-'");
    }
    size_t pos = 0;
    while (pos < text.size()) {
        next_xml_char(text, pos, "comment");
    }
    close_start_tag();
    emit("<!--");
    emit(text);
    emit("-->");
}

void MarkupWriter::write_end_element() {
    check_writable();
    if (open_elements_.empty()) {
        fail("write_end_element without an open element");
    }

    if (start_tag_open_) {
        emit(" />");
        start_tag_open_ = false;
        pending_attributes_.clear();
    } else {
        emit("</");
        emit(open_elements_.back());
        emit('>');
    }
    open_elements_.pop_back();
}

void MarkupWriter::write_element_string(std::string_view name, std::string_view text) {
    write_start_element(name);
    write_string(text);
    write_end_element();
}

void MarkupWriter::check_complete() const {
    if (!open_elements_.empty()) {
        fail("element '" + open_elements_.back() + "' is not closed");
    }
}

// ---------------------------------------------------------------------------
// JsonWriter
// ---------------------------------------------------------------------------

void JsonWriter::emit_quoted(std::string_view text) {
    if (utf8::find_invalid(text) != std::string_view::npos) {
        fail("invalid UTF-8 byte sequence in string");
    }

    std::string out;
    out.reserve(text.size() + 2);
    out += '"';
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F) {
                    out += hex_escape("\\u%04x", static_cast<unsigned char>(c));
                } else {
                    out += c;
                }
                break;
        }
    }
    out += '"';
    emit(out);
}

void JsonWriter::begin_value() {
    check_writable();

    if (stack_.empty()) {
        if (root_written_) {
            fail("a JSON document has exactly one top-level value");
        }
        root_written_ = true;
        return;
    }

    Frame& frame = stack_.back();
    if (frame.scope == Scope::Object) {
        if (!frame.expecting_value) {
            fail("a property name must precede each value in an object");
        }
        frame.expecting_value = false;
        return;
    }

    if (frame.has_items) emit(',');
    frame.has_items = true;
}

void JsonWriter::end_scope(Scope scope) {
    check_writable();
    if (stack_.empty() || stack_.back().scope != scope) {
        fail(scope == Scope::Object ? "write_end_object without a matching object"
                                    : "write_end_array without a matching array");
    }
    if (stack_.back().expecting_value) {
        fail("property is missing its value");
    }
    stack_.pop_back();
    emit(scope == Scope::Object ? '}' : ']');
}

void JsonWriter::write_start_object() {
    begin_value();
    emit('{');
    stack_.push_back({Scope::Object});
}

void JsonWriter::write_end_object() {
    end_scope(Scope::Object);
}

void JsonWriter::write_start_array() {
    begin_value();
    emit('[');
    stack_.push_back({Scope::Array});
}

void JsonWriter::write_end_array() {
    end_scope(Scope::Array);
}

void JsonWriter::write_property_name(std::string_view name) {
    check_writable();
    if (stack_.empty() || stack_.back().scope != Scope::Object) {
        fail("property '" + std::string(name) + "' written outside an object");
    }
    Frame& frame = stack_.back();
    if (frame.expecting_value) {
        fail("property '" + std::string(name) + "' follows a property without a value");
    }
    if (frame.has_items) emit(',');
    frame.has_items = true;
    frame.expecting_value = true;

    emit_quoted(name);
    emit(':');
}

void JsonWriter::write_string(std::string_view value) {
    begin_value();
    emit_quoted(value);
}

void JsonWriter::write_decimal(const Decimal& value) {
    begin_value();
    emit(value.text());
}

void JsonWriter::write_decimal(const std::optional<Decimal>& value) {
    if (value) {
        write_decimal(*value);
    } else {
        write_null();
    }
}

void JsonWriter::write_integer(int64_t value) {
    begin_value();
    emit(std::to_string(value));
}

void JsonWriter::write_bool(bool value) {
    begin_value();
    emit(value ? "true" : "false");
}

void JsonWriter::write_null() {
    begin_value();
    emit("null");
}

void JsonWriter::write_raw_value(std::string_view json) {
    begin_value();
    emit(json);
}

void JsonWriter::check_complete() const {
    if (!stack_.empty()) {
        fail(stack_.back().scope == Scope::Object ? "object is not closed" : "array is not closed");
    }
}

// ---------------------------------------------------------------------------
// Factory
// ---------------------------------------------------------------------------

std::unique_ptr<MarkupWriter> build_markup_writer(std::ostream& sink) {
    return std::make_unique<MarkupWriter>(sink);
}

std::unique_ptr<JsonWriter> build_json_writer(std::ostream& sink) {
    return std::make_unique<JsonWriter>(sink);
}

std::unique_ptr<Writer> build_writer(std::ostream& sink, Format format) {
    if (format == Format::Markup) {
        return build_markup_writer(sink);
    }
    return build_json_writer(sink);
}

} // namespace fidelity::io
