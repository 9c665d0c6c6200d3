#include <fidelity/xml/tokenizer.h>
#include <fidelity/core/utf8.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace fidelity::xml {

namespace {

bool is_xml_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string describe(char c) {
    if (c == '\0') return "end of file";
    if (std::isprint(static_cast<unsigned char>(c))) return std::string("'") + c + "'";
    return "byte 0x" + std::to_string(static_cast<unsigned char>(c));
}

std::string code_point_name(char32_t c) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(c));
    return buf;
}

Position position_of(std::string_view input, size_t offset) {
    Position where{1, 1};
    for (size_t i = 0; i < offset && i < input.size(); ++i) {
        if (input[i] == '\n') {
            ++where.line;
            where.column = 1;
        } else if ((static_cast<unsigned char>(input[i]) & 0xC0) != 0x80) {
            ++where.column;
        }
    }
    return where;
}

} // namespace

bool is_name_start_char(unsigned char c) {
    return std::isalpha(c) || c == '_' || c == ':' || c >= 0x80;
}

bool is_name_char(unsigned char c) {
    return is_name_start_char(c) || std::isdigit(c) || c == '-' || c == '.';
}

void check_characters(std::string_view input) {
    size_t pos = 0;
    while (pos < input.size()) {
        size_t start = pos;
        auto codepoint = utf8::next_code_point(input, pos);
        if (!codepoint) {
            throw FormatError(kErrorPrefix, "Invalid UTF-8 byte sequence", position_of(input, start));
        }
        if (!utf8::is_xml_char(*codepoint)) {
            throw FormatError(kErrorPrefix,
                "Character " + code_point_name(*codepoint) + " is not allowed in XML", position_of(input, start));
        }
    }
}

Tokenizer::Tokenizer(std::string_view input) : input_(input) {}

char Tokenizer::consume() {
    if (at_end()) return '\0';

    char c = input_[pos_++];
    if (c == '\r') {
        // "\r\n" and a lone "\r" both read as "\n"
        if (pos_ < input_.size() && input_[pos_] == '\n') ++pos_;
        c = '\n';
    }
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
        ++column_;
    }
    return c;
}

char Tokenizer::peek(size_t ahead) const {
    if (pos_ + ahead < input_.size()) {
        return input_[pos_ + ahead];
    }
    return '\0';
}

bool Tokenizer::lookahead(std::string_view text) const {
    return input_.compare(pos_, text.size(), text) == 0;
}

void Tokenizer::expect(std::string_view text, const char* what) {
    if (!lookahead(text)) {
        fail(std::string("Expected ") + what + " but found " + describe(peek()));
    }
    for (size_t i = 0; i < text.size(); ++i) consume();
}

bool Tokenizer::skip_whitespace() {
    bool skipped = false;
    while (!at_end() && is_xml_whitespace(peek())) {
        consume();
        skipped = true;
    }
    return skipped;
}

void Tokenizer::fail(const std::string& message) const {
    fail(message, position());
}

void Tokenizer::fail(const std::string& message, Position where) const {
    throw FormatError(kErrorPrefix, message, where);
}

Token Tokenizer::next_token() {
    Token token;
    token.position = position();

    if (at_end()) {
        token.type = Token::EndOfFile;
        return token;
    }

    if (peek() != '<') {
        return read_text();
    }

    Position start = position();
    bool at_document_start = (pos_ == 0);

    if (lookahead("<?")) {
        consume(); consume();
        return read_processing_instruction(start, at_document_start);
    }
    if (lookahead("<!--")) {
        return read_comment(start);
    }
    if (lookahead("<![CDATA[")) {
        return read_cdata(start);
    }
    if (lookahead("<!")) {
        return read_declaration(start);
    }
    if (lookahead("</")) {
        return read_end_tag(start);
    }

    consume(); // '<'
    return read_start_tag(start);
}

Token Tokenizer::read_text() {
    Token token;
    token.type = Token::Character;
    token.position = position();
    token.whitespace_only = true;

    while (!at_end() && peek() != '<') {
        if (peek() == '&') {
            consume();
            read_reference(token.data);
            token.whitespace_only = false;
            continue;
        }
        if (lookahead("]]>")) {
            fail("The sequence ']]>' is not allowed in content");
        }
        char c = consume();
        if (!is_xml_whitespace(c)) token.whitespace_only = false;
        token.data += c;
    }
    return token;
}

void Tokenizer::read_reference(std::string& out) {
    // '&' already consumed
    Position where{line_, column_ - 1};

    if (peek() == '#') {
        consume();
        bool hex = false;
        if (peek() == 'x') {
            hex = true;
            consume();
        }

        std::string digits;
        while (!at_end() && (hex ? std::isxdigit(static_cast<unsigned char>(peek()))
                                 : std::isdigit(static_cast<unsigned char>(peek())))) {
            digits += consume();
        }
        if (digits.empty() || peek() != ';' || digits.size() > 8) {
            fail("Invalid character reference", where);
        }
        consume(); // ';'

        unsigned long codepoint = std::strtoul(digits.c_str(), nullptr, hex ? 16 : 10);
        if (!utf8::is_xml_char(static_cast<char32_t>(codepoint))) {
            fail("Character reference '&#" + std::string(hex ? "x" : "") + digits +
                 ";' does not denote a valid XML character", where);
        }
        utf8::append(out, static_cast<char32_t>(codepoint));
        return;
    }

    if (at_end() || !is_name_start_char(static_cast<unsigned char>(peek()))) {
        fail("Unescaped '&' in content", where);
    }

    std::string name;
    while (!at_end() && is_name_char(static_cast<unsigned char>(peek()))) {
        name += consume();
    }
    if (peek() != ';') {
        fail("Reference to '" + name + "' is not terminated by ';'", where);
    }
    consume(); // ';'

    if (name == "lt") out += '<';
    else if (name == "gt") out += '>';
    else if (name == "amp") out += '&';
    else if (name == "quot") out += '"';
    else if (name == "apos") out += '\'';
    else fail("Reference to undeclared entity '" + name + "'", where);
}

std::string Tokenizer::read_name(const char* context) {
    if (at_end() || !is_name_start_char(static_cast<unsigned char>(peek()))) {
        fail(std::string("Invalid ") + context + " name: unexpected " + describe(peek()));
    }
    std::string name;
    while (!at_end() && is_name_char(static_cast<unsigned char>(peek()))) {
        name += consume();
    }
    return name;
}

std::string Tokenizer::read_attribute_value() {
    char quote = peek();
    if (quote != '"' && quote != '\'') {
        fail("Attribute value must be quoted, found " + describe(quote));
    }
    consume();

    std::string value;
    while (true) {
        if (at_end()) {
            fail("Unexpected end of file in attribute value");
        }
        char c = peek();
        if (c == quote) {
            consume();
            break;
        }
        if (c == '<') {
            fail("'<' is not allowed in attribute values");
        }
        if (c == '&') {
            consume();
            read_reference(value);
            continue;
        }
        c = consume();
        // Literal whitespace normalizes to a space; referenced whitespace does not
        value += (c == '\n' || c == '\t') ? ' ' : c;
    }
    return value;
}

Token Tokenizer::read_start_tag(Position start) {
    Token token;
    token.type = Token::StartTag;
    token.position = start;
    token.name = read_name("element");

    while (true) {
        bool had_whitespace = skip_whitespace();
        if (at_end()) {
            fail("Unexpected end of file inside start tag '" + token.name + "'");
        }
        if (peek() == '>') {
            consume();
            break;
        }
        if (lookahead("/>")) {
            consume(); consume();
            token.self_closing = true;
            break;
        }
        if (!had_whitespace) {
            fail("Whitespace is required between attributes in '" + token.name + "'");
        }

        Attribute attr;
        attr.position = position();
        attr.name = read_name("attribute");
        skip_whitespace();
        expect("=", "'=' after attribute name");
        skip_whitespace();
        attr.value = read_attribute_value();

        bool duplicate = std::any_of(token.attributes.begin(), token.attributes.end(),
            [&](const Attribute& a) { return a.name == attr.name; });
        if (duplicate) {
            fail("Attribute '" + attr.name + "' is declared more than once", attr.position);
        }
        token.attributes.push_back(std::move(attr));
    }
    return token;
}

Token Tokenizer::read_end_tag(Position start) {
    consume(); consume(); // "</"
    Token token;
    token.type = Token::EndTag;
    token.position = start;
    token.name = read_name("element");
    skip_whitespace();
    expect(">", "'>' to close end tag");
    return token;
}

Token Tokenizer::read_comment(Position start) {
    for (int i = 0; i < 4; ++i) consume(); // "<!--"
    Token token;
    token.type = Token::Comment;
    token.position = start;

    while (true) {
        if (at_end()) {
            fail("Unexpected end of file inside comment", start);
        }
        if (lookahead("--")) {
            if (peek(2) != '>') {
                fail("'--' is not allowed inside a comment");
            }
            consume(); consume(); consume();
            break;
        }
        token.data += consume();
    }
    return token;
}

Token Tokenizer::read_cdata(Position start) {
    for (int i = 0; i < 9; ++i) consume(); // "<![CDATA["
    Token token;
    token.type = Token::CData;
    token.position = start;

    while (true) {
        if (at_end()) {
            fail("Unexpected end of file inside CDATA section", start);
        }
        if (lookahead("]]>")) {
            consume(); consume(); consume();
            break;
        }
        token.data += consume();
    }
    return token;
}

Token Tokenizer::read_processing_instruction(Position start, bool at_document_start) {
    Token token;
    token.type = Token::ProcessingInstruction;
    token.position = start;
    token.name = read_name("processing instruction");

    if (to_lower(token.name) == "xml") {
        if (!at_document_start || token.name != "xml") {
            fail("The XML declaration must be the first node in the document", start);
        }
        token.type = Token::XmlDeclaration;
        parse_xml_declaration(token);
        return token;
    }

    if (!lookahead("?>") && !skip_whitespace()) {
        fail("Whitespace is required after processing instruction target");
    }
    while (true) {
        if (at_end()) {
            fail("Unexpected end of file inside processing instruction", start);
        }
        if (lookahead("?>")) {
            consume(); consume();
            break;
        }
        token.data += consume();
    }
    return token;
}

void Tokenizer::parse_xml_declaration(Token& token) {
    while (true) {
        bool had_whitespace = skip_whitespace();
        if (lookahead("?>")) {
            consume(); consume();
            break;
        }
        if (at_end()) {
            fail("Unexpected end of file inside XML declaration", token.position);
        }
        if (!had_whitespace) {
            fail("Whitespace is required in the XML declaration");
        }

        Position where = position();
        std::string name = read_name("XML declaration attribute");
        skip_whitespace();
        expect("=", "'=' in XML declaration");
        skip_whitespace();
        std::string value = read_attribute_value();

        if (name == "version" && token.version.empty()) {
            token.version = value;
        } else if (name == "encoding" && token.encoding.empty()) {
            token.encoding = value;
        } else if (name == "standalone" && token.standalone.empty()) {
            token.standalone = value;
        } else {
            fail("Unexpected '" + name + "' in XML declaration", where);
        }
    }

    if (token.version != "1.0" && token.version != "1.1") {
        fail("Unsupported XML version '" + token.version + "'", token.position);
    }
    if (!token.encoding.empty()) {
        std::string enc = to_lower(token.encoding);
        if (enc != "utf-8" && enc != "utf8" && enc != "us-ascii" && enc != "ascii") {
            fail("Encoding '" + token.encoding + "' is not supported, input must be UTF-8",
                 token.position);
        }
    }
    if (!token.standalone.empty() && token.standalone != "yes" && token.standalone != "no") {
        fail("Invalid standalone value '" + token.standalone + "'", token.position);
    }
}

Token Tokenizer::read_declaration(Position start) {
    consume(); consume(); // "<!"
    std::string keyword;
    while (!at_end() && std::isalpha(static_cast<unsigned char>(peek()))) {
        keyword += static_cast<char>(std::toupper(static_cast<unsigned char>(consume())));
    }

    if (keyword == "DOCTYPE") {
        throw SecurityRejected(kErrorPrefix,
            "DOCTYPE declarations are prohibited in this document", start);
    }
    if (keyword == "ENTITY" || keyword == "ELEMENT" || keyword == "ATTLIST" || keyword == "NOTATION") {
        throw SecurityRejected(kErrorPrefix,
            "'<!" + keyword + "' declarations are prohibited in this document", start);
    }
    fail("Unexpected markup declaration '<!" + keyword + "'", start);
}

} // namespace fidelity::xml
