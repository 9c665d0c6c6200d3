#include <fidelity/io/reader.h>
#include <fidelity/core/config.h>
#include <fidelity/core/error.h>
#include <fidelity/core/utf8.h>
#include <fidelity/io/compression.h>
#include <fidelity/json/parser.h>
#include <fidelity/text/sanitizer.h>
#include <fidelity/xml/tree_builder.h>
#include <vector>

namespace fidelity::io {

namespace {

constexpr const char kModule[] = "reader";

void report(core::DiagnosticEmitter* diagnostics, core::Severity severity,
            const std::string& stage, const std::string& message) {
    if (diagnostics) {
        diagnostics->emit(severity, kModule, stage, message);
    }
}

void report_failure(core::DiagnosticEmitter* diagnostics, const FormatError& error) {
    bool rejected = dynamic_cast<const SecurityRejected*>(&error) != nullptr;
    report(diagnostics, core::Severity::Error, rejected ? "security" : "parse", error.what());
}

std::unique_ptr<Reader> make_reader(std::string_view raw, Format format,
                                    const ReaderOptions& options) {
    std::string_view text = utf8::strip_byte_order_mark(raw);
    if (format == Format::Markup) {
        return std::make_unique<MarkupReader>(text::sanitize_markup(text), options);
    }
    return std::make_unique<JsonReader>(std::string(text), options);
}

} // namespace

MarkupReader::MarkupReader(std::string text, const ReaderOptions& options)
    : text_(std::move(text))
    , options_(options) {}

std::unique_ptr<dom::Document> MarkupReader::read_markup() {
    xml::ParseOptions parse_options;
    parse_options.ignore_comments = options_.ignore_comments;

    std::unique_ptr<dom::Document> document;
    try {
        document = xml::parse_document(text_, parse_options);
    } catch (const FormatError& e) {
        report_failure(options_.diagnostics, e);
        throw;
    }

    report(options_.diagnostics, core::Severity::Info, "parse",
           "parsed xml document (" + std::to_string(text_.size()) + " bytes)");
    return document;
}

DocumentTree MarkupReader::read_document() {
    DocumentTree tree;
    tree.format = Format::Markup;
    tree.markup = read_markup();
    return tree;
}

JsonReader::JsonReader(std::string text, const ReaderOptions& options)
    : text_(std::move(text))
    , options_(options) {}

std::unique_ptr<json::Value> JsonReader::read_json() {
    std::unique_ptr<json::Value> root;
    try {
        root = std::make_unique<json::Value>(json::parse_document(text_));
    } catch (const FormatError& e) {
        report_failure(options_.diagnostics, e);
        throw;
    }

    report(options_.diagnostics, core::Severity::Info, "parse",
           "parsed json document (" + std::to_string(text_.size()) + " bytes)");
    return root;
}

DocumentTree JsonReader::read_document() {
    DocumentTree tree;
    tree.format = Format::ObjectNotation;
    tree.object = read_json();
    return tree;
}

std::string read_stream(std::istream& input) {
    if (!input.good()) {
        throw IoError("Input stream is not readable");
    }

    std::string content;
    std::vector<char> buffer(config::kStreamReadChunk);
    try {
        while (input) {
            input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            content.append(buffer.data(), static_cast<size_t>(input.gcount()));
        }
    } catch (const std::ios_base::failure& e) {
        throw IoError(std::string("Failed to read input stream: ") + e.what());
    }

    if (input.bad()) {
        throw IoError("Failed to read input stream");
    }
    return content;
}

std::unique_ptr<Reader> build_reader(std::string_view text, Format format,
                                     const ReaderOptions& options) {
    return make_reader(text, format, options);
}

std::unique_ptr<Reader> build_reader(std::istream& input, Format format,
                                     const ReaderOptions& options) {
    std::string content = read_stream(input);
    if (is_gzip(content)) {
        size_t compressed_size = content.size();
        content = decompress_gzip(content);
        report(options.diagnostics, core::Severity::Info, "inflate",
               "inflated gzip input (" + std::to_string(compressed_size) + " -> " +
               std::to_string(content.size()) + " bytes)");
    }
    return make_reader(content, format, options);
}

std::unique_ptr<dom::Document> read_markup(std::string_view text, const ReaderOptions& options) {
    return build_reader(text, Format::Markup, options)->read_document().markup;
}

std::unique_ptr<dom::Document> read_markup(std::istream& input, const ReaderOptions& options) {
    return build_reader(input, Format::Markup, options)->read_document().markup;
}

std::unique_ptr<json::Value> read_json(std::string_view text, const ReaderOptions& options) {
    return build_reader(text, Format::ObjectNotation, options)->read_document().object;
}

std::unique_ptr<json::Value> read_json(std::istream& input, const ReaderOptions& options) {
    return build_reader(input, Format::ObjectNotation, options)->read_document().object;
}

} // namespace fidelity::io
