#pragma once
#include <fidelity/core/diagnostics.h>
#include <fidelity/core/format.h>
#include <fidelity/dom/document.h>
#include <fidelity/json/value.h>
#include <istream>
#include <memory>
#include <string>
#include <string_view>

namespace fidelity::io {

// The only knob callers get. Everything else about parsing is fixed:
// no DTDs, no entity expansion beyond the predefined five, processing
// instructions and insignificant whitespace dropped, JSON numbers kept
// as exact decimal text, JSON dates left as strings.
struct ReaderOptions {
    bool ignore_comments = true;
    core::DiagnosticEmitter* diagnostics = nullptr;  // not owned
};

// Exactly one of markup/object is set, matching format.
struct DocumentTree {
    Format format = Format::Markup;
    std::unique_ptr<dom::Document> markup;
    std::unique_ptr<json::Value> object;
};

class Reader {
public:
    virtual ~Reader() = default;

    virtual Format format() const = 0;

    // Parses the buffered input. Throws FormatError (SecurityRejected for
    // DOCTYPE and declarations); never returns a partial tree.
    virtual DocumentTree read_document() = 0;
};

class MarkupReader : public Reader {
public:
    // text must already be sanitized and free of a byte order mark
    MarkupReader(std::string text, const ReaderOptions& options);

    Format format() const override { return Format::Markup; }
    DocumentTree read_document() override;
    std::unique_ptr<dom::Document> read_markup();

private:
    std::string text_;
    ReaderOptions options_;
};

class JsonReader : public Reader {
public:
    JsonReader(std::string text, const ReaderOptions& options);

    Format format() const override { return Format::ObjectNotation; }
    DocumentTree read_document() override;
    std::unique_ptr<json::Value> read_json();

private:
    std::string text_;
    ReaderOptions options_;
};

// Text sources and stream sources get the same treatment: the byte order
// mark is dropped and markup is passed through text::sanitize_markup.
// Stream sources starting with the gzip magic are inflated first. Stream
// failures and corrupt gzip data raise IoError.
std::unique_ptr<Reader> build_reader(std::string_view text, Format format,
                                     const ReaderOptions& options = {});
std::unique_ptr<Reader> build_reader(std::istream& input, Format format,
                                     const ReaderOptions& options = {});

std::unique_ptr<dom::Document> read_markup(std::string_view text, const ReaderOptions& options = {});
std::unique_ptr<dom::Document> read_markup(std::istream& input, const ReaderOptions& options = {});
std::unique_ptr<json::Value> read_json(std::string_view text, const ReaderOptions& options = {});
std::unique_ptr<json::Value> read_json(std::istream& input, const ReaderOptions& options = {});

// Reads the whole stream; IoError if it fails before end of file.
std::string read_stream(std::istream& input);

} // namespace fidelity::io
