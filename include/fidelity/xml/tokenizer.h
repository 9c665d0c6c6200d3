#pragma once
#include <fidelity/core/error.h>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace fidelity::xml {

inline constexpr const char kErrorPrefix[] = "Cannot parse xml";

struct Attribute {
    std::string name;
    std::string value;  // references decoded, whitespace normalized
    Position position;
};

struct Token {
    enum Type {
        XmlDeclaration, ProcessingInstruction,
        StartTag, EndTag, Character, CData, Comment, EndOfFile
    };
    Type type = EndOfFile;
    std::string name;   // tag name or PI target
    std::vector<Attribute> attributes;
    bool self_closing = false;
    std::string data;   // Character/CData/Comment/PI content
    bool whitespace_only = false;
    Position position;

    // XML declaration pseudo-attributes
    std::string version;
    std::string encoding;
    std::string standalone;
};

// Pull tokenizer for well-formed XML 1.0 text.
//
// There is no DTD support at all: "<!DOCTYPE" and any other declaration
// ("<!ENTITY", "<!ELEMENT", ...) raise SecurityRejected instead of being
// skipped. Only the five predefined entities and numeric character
// references are decoded; any other named reference is a FormatError.
// Line endings are normalized to '\n' as they are read.
class Tokenizer {
public:
    explicit Tokenizer(std::string_view input);

    Token next_token();
    Position position() const { return {line_, column_}; }

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;

    char consume();
    char peek(size_t ahead = 0) const;
    bool at_end() const { return pos_ >= input_.size(); }
    bool lookahead(std::string_view text) const;
    void expect(std::string_view text, const char* what);
    bool skip_whitespace();

    [[noreturn]] void fail(const std::string& message) const;
    [[noreturn]] void fail(const std::string& message, Position where) const;

    Token read_text();
    Token read_start_tag(Position start);
    Token read_end_tag(Position start);
    Token read_comment(Position start);
    Token read_cdata(Position start);
    Token read_processing_instruction(Position start, bool at_document_start);
    Token read_declaration(Position start);

    std::string read_name(const char* context);
    std::string read_attribute_value();
    void read_reference(std::string& out);
    void parse_xml_declaration(Token& token);
};

bool is_name_start_char(unsigned char c);
bool is_name_char(unsigned char c);

// Throws FormatError at the first byte that is not valid UTF-8 or not an
// XML 1.0 character.
void check_characters(std::string_view input);

} // namespace fidelity::xml
