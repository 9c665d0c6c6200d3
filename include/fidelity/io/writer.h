#pragma once
#include <fidelity/core/decimal.h>
#include <fidelity/core/format.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fidelity::io {

inline constexpr const char kWriterErrorPrefix[] = "Cannot write document";

class Writer {
public:
    explicit Writer(std::ostream& sink) : sink_(sink) {}
    virtual ~Writer() = default;

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    virtual Format format() const = 0;

    // Pushes everything written so far to the sink. IoError if the sink failed.
    void flush();

    // Checks that the document is complete, then flushes. Calling it twice is
    // harmless.
    void close();

    // Failure path: flush whatever reached the sink and stop accepting writes,
    // without the completeness check.
    void release() noexcept;

    bool closed() const { return closed_; }

protected:
    void emit(std::string_view text);
    void emit(char c);
    void check_writable() const;
    virtual void check_complete() const = 0;

    [[noreturn]] void fail(const std::string& message) const;

private:
    std::ostream& sink_;
    bool closed_ = false;
};

// Streaming XML writer. Output is UTF-8 without byte order mark and without
// an XML declaration. Newlines in text and attribute values are written as
// character references so no transport can normalize them away.
class MarkupWriter : public Writer {
public:
    explicit MarkupWriter(std::ostream& sink) : Writer(sink) {}

    Format format() const override { return Format::Markup; }

    void write_start_element(std::string_view name);
    void write_attribute(std::string_view name, std::string_view value);
    void write_string(std::string_view text);
    void write_comment(std::string_view text);
    void write_end_element();
    void write_element_string(std::string_view name, std::string_view text);

    size_t depth() const { return open_elements_.size(); }

protected:
    void check_complete() const override;

private:
    std::vector<std::string> open_elements_;
    std::vector<std::string> pending_attributes_;
    bool start_tag_open_ = false;
    bool root_written_ = false;

    void close_start_tag();
    void check_name(std::string_view name, const char* what) const;
    // Decodes one code point at pos; FormatError unless it is an XML Char.
    char32_t next_xml_char(std::string_view text, size_t& pos, const char* context) const;
    void emit_escaped(std::string_view text, bool in_attribute);
};

// Streaming compact JSON writer. Decimals are written as their exact text,
// never re-formatted through a binary float.
class JsonWriter : public Writer {
public:
    explicit JsonWriter(std::ostream& sink) : Writer(sink) {}

    Format format() const override { return Format::ObjectNotation; }

    void write_start_object();
    void write_end_object();
    void write_start_array();
    void write_end_array();
    void write_property_name(std::string_view name);

    void write_string(std::string_view value);
    void write_decimal(const Decimal& value);
    void write_decimal(const std::optional<Decimal>& value);  // nullopt -> null
    void write_integer(int64_t value);
    void write_bool(bool value);
    void write_null();
    void write_raw_value(std::string_view json);

protected:
    void check_complete() const override;

private:
    enum class Scope { Object, Array };
    struct Frame {
        Scope scope;
        bool has_items = false;
        bool expecting_value = false;
    };

    std::vector<Frame> stack_;
    bool root_written_ = false;

    void begin_value();
    void end_scope(Scope scope);
    void emit_quoted(std::string_view text);
};

std::unique_ptr<Writer> build_writer(std::ostream& sink, Format format);
std::unique_ptr<MarkupWriter> build_markup_writer(std::ostream& sink);
std::unique_ptr<JsonWriter> build_json_writer(std::ostream& sink);

// Owns a writer bound to a sink for one scoped write. Unless commit() ran,
// the destructor releases the writer, so the sink is flushed on every exit
// path including an exception thrown by the write action.
template<typename W>
class WriteScope {
public:
    explicit WriteScope(std::ostream& sink) : writer_(sink) {}
    ~WriteScope() {
        if (!committed_) writer_.release();
    }

    WriteScope(const WriteScope&) = delete;
    WriteScope& operator=(const WriteScope&) = delete;

    W& writer() { return writer_; }

    void commit() {
        writer_.close();
        committed_ = true;
    }

private:
    W writer_;
    bool committed_ = false;
};

// Runs action against a fresh writer on sink and closes it cleanly.
template<typename W, typename Action>
void write_document_to(std::ostream& sink, Action&& action) {
    WriteScope<W> scope(sink);
    std::forward<Action>(action)(scope.writer());
    scope.commit();
}

// In-memory variant; the text is returned only after a clean close.
template<typename W, typename Action>
std::string write_document(Action&& action) {
    std::ostringstream buffer;
    write_document_to<W>(buffer, std::forward<Action>(action));
    return buffer.str();
}

template<typename Action>
std::string write_markup_to_string(Action&& action) {
    return write_document<MarkupWriter>(std::forward<Action>(action));
}

template<typename Action>
std::string write_json_to_string(Action&& action) {
    return write_document<JsonWriter>(std::forward<Action>(action));
}

template<typename Action>
std::vector<uint8_t> write_markup_to_bytes(Action&& action) {
    std::string text = write_markup_to_string(std::forward<Action>(action));
    return std::vector<uint8_t>(text.begin(), text.end());
}

template<typename Action>
std::vector<uint8_t> write_json_to_bytes(Action&& action) {
    std::string text = write_json_to_string(std::forward<Action>(action));
    return std::vector<uint8_t>(text.begin(), text.end());
}

} // namespace fidelity::io
