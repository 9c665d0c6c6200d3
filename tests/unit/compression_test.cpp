#include <fidelity/core/error.h>
#include <fidelity/io/compression.h>
#include <fidelity/io/reader.h>
#include <gtest/gtest.h>
#include <sstream>
#include <string>

using fidelity::IoError;
using fidelity::core::DiagnosticEmitter;
using namespace fidelity::io;

TEST(Compression, DetectsGzipMagic) {
    EXPECT_TRUE(is_gzip(compress_gzip("<a/>")));
    EXPECT_FALSE(is_gzip("<a/>"));
    EXPECT_FALSE(is_gzip("\x1F"));
    EXPECT_FALSE(is_gzip(""));
}

TEST(Compression, InflatesWhatItDeflates) {
    std::string body;
    for (int i = 0; i < 5000; ++i) body += "<entry value=\"caf&eacute;\"/>";
    std::string packed = compress_gzip(body);
    EXPECT_LT(packed.size(), body.size());
    EXPECT_EQ(decompress_gzip(packed), body);
}

TEST(Compression, CorruptDataRaisesIoError) {
    std::string packed = compress_gzip("{\"resourceType\":\"Patient\"}");
    std::string truncated = packed.substr(0, packed.size() / 2);
    EXPECT_THROW(decompress_gzip(truncated), IoError);

    std::string garbage = "\x1F\x8B garbage";
    EXPECT_THROW(decompress_gzip(garbage), IoError);
}

// Concatenated gzip members decode as one stream
TEST(Compression, DecodesEveryMember) {
    std::string packed = compress_gzip("{\"a\":1,") + compress_gzip("\"b\":2}");
    EXPECT_EQ(decompress_gzip(packed), "{\"a\":1,\"b\":2}");

    std::istringstream input(packed);
    auto root = read_json(input);
    EXPECT_EQ(root->size(), 2u);
    EXPECT_EQ(root->find("b")->as_decimal().text(), "2");
}

// Content in a later member is parsed, so trailing text is still rejected
TEST(Compression, LaterMemberContentIsNotDropped) {
    std::istringstream input(compress_gzip("{\"a\":1}") + compress_gzip(",\"b\":2}garbage"));
    EXPECT_THROW(read_json(input), fidelity::FormatError);
}

TEST(Compression, TrailingBytesAfterMemberRaiseIoError) {
    EXPECT_THROW(decompress_gzip(compress_gzip("<a/>") + "trailing"), IoError);
    EXPECT_THROW(decompress_gzip(compress_gzip("<a/>") + std::string("\x1F\x8B", 2)), IoError);
}

// Output is capped so a small input cannot expand without bound
TEST(Compression, OutputSizeIsCapped) {
    std::string body(1024 * 1024, 'a');
    std::string packed = compress_gzip(body);
    EXPECT_LT(packed.size(), 16u * 1024);

    EXPECT_EQ(decompress_gzip(packed, body.size()).size(), body.size());
    try {
        decompress_gzip(packed, body.size() - 1);
        FAIL() << "expected IoError";
    } catch (const IoError& e) {
        EXPECT_NE(std::string(e.what()).find("exceeds the limit"), std::string::npos);
    }

    std::string two_members = packed + packed;
    EXPECT_THROW(decompress_gzip(two_members, body.size() + body.size() / 2), IoError);
}

TEST(Compression, DefaultCapMatchesConfiguration) {
    EXPECT_EQ(fidelity::config::kMaxInflatedSize, 256u * 1024 * 1024);
    std::string empty_member = compress_gzip("");
    EXPECT_EQ(decompress_gzip(empty_member), "");
}

// Stream sources are inflated before sanitizing and parsing
TEST(Compression, ReaderInflatesGzipStreams) {
    DiagnosticEmitter diagnostics;
    ReaderOptions options;
    options.diagnostics = &diagnostics;

    std::istringstream markup(compress_gzip("<name value=\"Ren&eacute;e\"/>"));
    auto doc = read_markup(markup, options);
    EXPECT_EQ(doc->document_element()->get_attribute("value").value(), "Ren\xC3\xA9" "e");
    ASSERT_EQ(diagnostics.events_by_severity(fidelity::core::Severity::Info).size(), 2u);
    EXPECT_EQ(diagnostics.events()[0].stage, "inflate");

    std::istringstream object(compress_gzip("{\"value\":1.50}"));
    EXPECT_EQ(read_json(object)->find("value")->as_decimal().text(), "1.50");
}

TEST(Compression, ReaderRejectsCorruptGzipStreams) {
    std::istringstream input(std::string("\x1F\x8B\x08\x00", 4));
    EXPECT_THROW(read_json(input), IoError);
}
