#include <fidelity/text/entity_table.h>
#include <fidelity/text/sanitizer.h>
#include <gtest/gtest.h>
#include <clocale>
#include <string>
#include <vector>

using fidelity::text::EntityTable;
using fidelity::text::find_entity_tokens;
using fidelity::text::sanitize_markup;

// ============================================================================
// Token scanning
// ============================================================================

// 1. Every entity-shaped run is reported, known or not
TEST(EntityScanner, FindsAllCandidates) {
    auto matches = find_entity_tokens("a&b;c&amp;d&unknown9;");
    ASSERT_EQ(matches.size(), 3u);
    EXPECT_EQ(matches[0].offset, 1u);
    EXPECT_EQ(matches[0].length, 3u);
    EXPECT_EQ(matches[0].text, "&b;");
    EXPECT_EQ(matches[0].name(), "b");
    EXPECT_EQ(matches[1].text, "&amp;");
    EXPECT_EQ(matches[2].text, "&unknown9;");
    EXPECT_EQ(matches[2].offset, 11u);
}

// 2. Shapes that do not match
TEST(EntityScanner, IgnoresIncompleteShapes) {
    EXPECT_TRUE(find_entity_tokens("").empty());
    EXPECT_TRUE(find_entity_tokens("&").empty());
    EXPECT_TRUE(find_entity_tokens("&;").empty());
    EXPECT_TRUE(find_entity_tokens("&eacute").empty());
    EXPECT_TRUE(find_entity_tokens("&e acute;").empty());
    EXPECT_TRUE(find_entity_tokens("&#233;").empty());
    EXPECT_TRUE(find_entity_tokens("&e-acute;").empty());
}

// 3. A failed candidate does not swallow the next one
TEST(EntityScanner, RestartsAfterFailedCandidate) {
    auto matches = find_entity_tokens("&&eacute;&ab&cd;");
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].offset, 1u);
    EXPECT_EQ(matches[0].text, "&eacute;");
    EXPECT_EQ(matches[1].offset, 12u);
    EXPECT_EQ(matches[1].text, "&cd;");
}

// 4. Names are ASCII letters and digits whatever the process locale says
TEST(EntityScanner, NameCharactersAreAsciiOnly) {
    const std::string saved = std::setlocale(LC_CTYPE, nullptr);
    const char* latin1_locales[] = {"en_US.ISO-8859-1", "en_US.iso88591", "de_DE.ISO-8859-1"};
    for (const char* name : latin1_locales) {
        if (std::setlocale(LC_CTYPE, name)) break;
    }

    EXPECT_TRUE(find_entity_tokens("&caf\xE9;").empty());
    EXPECT_TRUE(find_entity_tokens("&\xC0\xFF;").empty());
    EXPECT_EQ(sanitize_markup("&eacute\xE9;"), "&eacute\xE9;");

    auto matches = find_entity_tokens("&\xE9&eacute;");
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].offset, 2u);

    std::setlocale(LC_CTYPE, saved.c_str());
}

TEST(EntityScanner, NameCharacterClass) {
    using fidelity::text::is_entity_name_char;
    EXPECT_TRUE(is_entity_name_char('a'));
    EXPECT_TRUE(is_entity_name_char('Z'));
    EXPECT_TRUE(is_entity_name_char('7'));
    EXPECT_FALSE(is_entity_name_char('_'));
    EXPECT_FALSE(is_entity_name_char('#'));
    EXPECT_FALSE(is_entity_name_char(static_cast<char>(0xE9)));
    EXPECT_FALSE(is_entity_name_char(static_cast<char>(0xAA)));
}

// ============================================================================
// Sanitizing
// ============================================================================

TEST(Sanitizer, EmptyInput) {
    EXPECT_EQ(sanitize_markup(""), "");
}

TEST(Sanitizer, InputWithoutEntitiesIsUnchanged) {
    const std::string xml = "<Patient><name value=\"Smith\"/></Patient>";
    EXPECT_EQ(sanitize_markup(xml), xml);
}

TEST(Sanitizer, ReplacesKnownEntity) {
    EXPECT_EQ(sanitize_markup("&eacute;"), "&#233;");
    EXPECT_EQ(sanitize_markup("<p>Caf&eacute; cr&egrave;me</p>"), "<p>Caf&#233; cr&#232;me</p>");
}

TEST(Sanitizer, ReservedEntitiesArePreserved) {
    for (const char* reserved : {"&quot;", "&amp;", "&lt;", "&gt;", "&apos;"}) {
        EXPECT_EQ(sanitize_markup(reserved), reserved);
    }
    EXPECT_EQ(sanitize_markup("a &lt; b &amp;&amp; c &gt; d &nbsp;"),
              "a &lt; b &amp;&amp; c &gt; d &#160;");
}

TEST(Sanitizer, UnknownEntityPassesThrough) {
    EXPECT_EQ(sanitize_markup("&unknownEntity123;"), "&unknownEntity123;");
    EXPECT_EQ(sanitize_markup("x&EACUTE;y"), "x&EACUTE;y");
}

TEST(Sanitizer, MalformedReferencesPassThrough) {
    EXPECT_EQ(sanitize_markup("AT&T"), "AT&T");
    EXPECT_EQ(sanitize_markup("&eacute"), "&eacute");
    EXPECT_EQ(sanitize_markup("&&eacute;"), "&&#233;");
    EXPECT_EQ(sanitize_markup("&#233; &#xE9;"), "&#233; &#xE9;");
}

TEST(Sanitizer, NonAsciiBytesAreCopiedVerbatim) {
    const std::string text = "\xC3\xA9t\xC3\xA9 &mdash; \xE2\x82\xAC";
    EXPECT_EQ(sanitize_markup(text), "\xC3\xA9t\xC3\xA9 &#8212; \xE2\x82\xAC");
}

TEST(Sanitizer, EveryTableEntryIsRewritten) {
    EntityTable::instance().for_each([](std::string_view name, std::string_view ref) {
        std::string input = "&" + std::string(name) + ";";
        EXPECT_EQ(sanitize_markup(input), ref) << input;
    });
}

TEST(Sanitizer, IsIdempotent) {
    const std::vector<std::string> samples = {
        "",
        "plain",
        "&eacute;&amp;&unknown;",
        "<a title=\"&laquo;x&raquo;\">&hellip;&#160;&nbsp;</a>",
        "&&&;;;&nbsp",
    };
    for (const auto& sample : samples) {
        std::string once = sanitize_markup(sample);
        EXPECT_EQ(sanitize_markup(once), once) << sample;
    }
}

TEST(Sanitizer, LargeInputIsProcessedInOnePass) {
    std::string input;
    std::string expected;
    for (int i = 0; i < 50000; ++i) {
        input += "x&eacute;y&amp;z&bogus;";
        expected += "x&#233;y&amp;z&bogus;";
    }
    EXPECT_EQ(sanitize_markup(input), expected);
}
