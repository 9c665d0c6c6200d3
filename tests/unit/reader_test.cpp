#include <fidelity/io/reader.h>
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <string>

using fidelity::Format;
using fidelity::FormatError;
using fidelity::IoError;
using fidelity::SecurityRejected;
using fidelity::core::DiagnosticEmitter;
using fidelity::core::Severity;
using namespace fidelity::io;

namespace {

class FailingBuffer : public std::streambuf {
protected:
    int_type underflow() override {
        throw std::runtime_error("device error");
    }
};

} // namespace

// ============================================================================
// Markup sources
// ============================================================================

// 1. HTML named entities in text sources are rewritten before parsing
TEST(ReaderMarkup, SanitizesTextSource) {
    auto doc = read_markup("<name value=\"Ren&eacute;e\">caf&eacute;&nbsp;&amp;</name>");
    auto* name = doc->document_element();
    ASSERT_NE(name, nullptr);
    EXPECT_EQ(name->get_attribute("value").value(), "Ren\xC3\xA9" "e");
    EXPECT_EQ(name->text_content(), "caf\xC3\xA9\xC2\xA0&");
}

// 2. Stream sources get the same rewrite
TEST(ReaderMarkup, SanitizesStreamSource) {
    std::istringstream input("<div>&copy; 2024</div>");
    auto doc = read_markup(input);
    EXPECT_EQ(doc->document_element()->text_content(), "\xC2\xA9 2024");
}

// 3. A leading byte order mark is dropped
TEST(ReaderMarkup, StripsByteOrderMark) {
    auto doc = read_markup("\xEF\xBB\xBF<?xml version=\"1.0\"?><a/>");
    EXPECT_EQ(doc->document_element()->name(), "a");
}

// 4. Comments follow the reader option
TEST(ReaderMarkup, CommentOption) {
    const std::string input = "<a><!--x--></a>";
    EXPECT_EQ(read_markup(input)->document_element()->child_count(), 0u);

    ReaderOptions options;
    options.ignore_comments = false;
    EXPECT_EQ(read_markup(input, options)->document_element()->child_count(), 1u);
}

// 5. Unknown entity names still fail in the parser
TEST(ReaderMarkup, UnknownEntityFails) {
    EXPECT_THROW(read_markup("<a>&bogus;</a>"), FormatError);
}

// 6. DOCTYPE is rejected and reported as a security event
TEST(ReaderMarkup, DoctypeRejectedAndReported) {
    DiagnosticEmitter diagnostics;
    ReaderOptions options;
    options.diagnostics = &diagnostics;

    EXPECT_THROW(read_markup("<!DOCTYPE foo [<!ENTITY x SYSTEM \"file:///etc/passwd\">]><foo>&x;</foo>",
                             options),
                 SecurityRejected);

    auto errors = diagnostics.events_by_severity(Severity::Error);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].module, "reader");
    EXPECT_EQ(errors[0].stage, "security");
    EXPECT_NE(errors[0].message.find("DOCTYPE"), std::string::npos);
}

// 7. Ordinary parse failures are reported under the parse stage
TEST(ReaderMarkup, ParseFailureReported) {
    DiagnosticEmitter diagnostics;
    ReaderOptions options;
    options.diagnostics = &diagnostics;

    EXPECT_THROW(read_markup("<a>", options), FormatError);
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics.events()[0].stage, "parse");
    EXPECT_EQ(diagnostics.events()[0].severity, Severity::Error);
}

// 8. Success is logged at info level
TEST(ReaderMarkup, SuccessReported) {
    DiagnosticEmitter diagnostics;
    ReaderOptions options;
    options.diagnostics = &diagnostics;

    read_markup("<a/>", options);
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics.events()[0].severity, Severity::Info);
    EXPECT_EQ(diagnostics.events()[0].message, "parsed xml document (4 bytes)");
}

// ============================================================================
// JSON sources
// ============================================================================

TEST(ReaderJson, ReadsTextAndStream) {
    auto from_text = read_json("{\"resourceType\":\"Patient\"}");
    EXPECT_EQ(from_text->find("resourceType")->as_string(), "Patient");

    std::istringstream input("\xEF\xBB\xBF{\"a\":[1.0]}");
    auto from_stream = read_json(input);
    EXPECT_EQ(from_stream->find("a")->as_array()[0].as_decimal().text(), "1.0");
}

// JSON strings are not entity-rewritten
TEST(ReaderJson, LeavesEntitiesAlone) {
    auto root = read_json("{\"div\":\"caf&eacute;\"}");
    EXPECT_EQ(root->find("div")->as_string(), "caf&eacute;");
}

TEST(ReaderJson, FailureReported) {
    DiagnosticEmitter diagnostics;
    ReaderOptions options;
    options.diagnostics = &diagnostics;

    EXPECT_THROW(read_json("[]", options), FormatError);
    EXPECT_EQ(diagnostics.events_by_module("reader").size(), 1u);
}

// ============================================================================
// Reader objects
// ============================================================================

TEST(ReaderFactory, BuildsReaderForFormat) {
    auto markup = build_reader("<a/>", Format::Markup);
    EXPECT_EQ(markup->format(), Format::Markup);
    DocumentTree tree = markup->read_document();
    EXPECT_EQ(tree.format, Format::Markup);
    EXPECT_NE(tree.markup, nullptr);
    EXPECT_EQ(tree.object, nullptr);

    auto json = build_reader("{}", Format::ObjectNotation);
    EXPECT_EQ(json->format(), Format::ObjectNotation);
    DocumentTree object_tree = json->read_document();
    EXPECT_EQ(object_tree.markup, nullptr);
    ASSERT_NE(object_tree.object, nullptr);
    EXPECT_TRUE(object_tree.object->is_object());
}

// ============================================================================
// Stream failures
// ============================================================================

TEST(ReaderStream, UnreadableStreamRaisesIoError) {
    std::istringstream input("<a/>");
    input.setstate(std::ios::failbit);
    EXPECT_THROW(read_markup(input), IoError);
}

TEST(ReaderStream, DeviceFailureRaisesIoError) {
    FailingBuffer buffer;
    std::istream input(&buffer);
    EXPECT_THROW(read_json(input), IoError);
}

TEST(ReaderStream, ReadsLargeInputAcrossChunks) {
    std::string body(200 * 1024, 'x');
    std::istringstream input("<a>" + body + "</a>");
    EXPECT_EQ(read_stream(input).size(), body.size() + 7);
}
