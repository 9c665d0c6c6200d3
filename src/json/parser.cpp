#include <fidelity/json/parser.h>
#include <fidelity/core/config.h>
#include <fidelity/core/utf8.h>
#include <cctype>
#include <unordered_set>

namespace fidelity::json {

namespace {

std::string describe(char c) {
    if (c == '\0') return "end of input";
    if (std::isprint(static_cast<unsigned char>(c))) return std::string("'") + c + "'";
    return "byte 0x" + std::to_string(static_cast<unsigned char>(c));
}

bool is_number_char(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) ||
           c == '-' || c == '+' || c == '.' || c == 'e' || c == 'E';
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

Parser::Parser(std::string_view input) : input_(input) {}

char Parser::consume() {
    if (at_end()) return '\0';
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
        ++column_;
    }
    return c;
}

void Parser::fail(const std::string& message) const {
    fail(message, position());
}

void Parser::fail(const std::string& message, Position where) const {
    throw FormatError(kErrorPrefix, message, where);
}

void Parser::skip_whitespace_and_comments() {
    while (!at_end()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            consume();
            continue;
        }
        if (c != '/') return;

        Position start = position();
        consume();
        if (peek() == '/') {
            while (!at_end() && peek() != '\n') consume();
        } else if (peek() == '*') {
            consume();
            while (true) {
                if (at_end()) fail("Unterminated comment", start);
                if (consume() == '*' && peek() == '/') {
                    consume();
                    break;
                }
            }
        } else {
            fail("Unexpected character '/'", start);
        }
    }
}

Value Parser::parse_document() {
    size_t invalid = utf8::find_invalid(input_);
    if (invalid != std::string_view::npos) {
        // Walk to the offending byte so the error carries its position
        while (pos_ < invalid) consume();
        fail("Invalid UTF-8 byte sequence");
    }

    skip_whitespace_and_comments();
    if (at_end()) {
        fail("Unexpected end of input, expected an object");
    }
    if (peek() != '{') {
        fail("Root value must be an object, found " + describe(peek()));
    }

    Value root = parse_object(1);

    skip_whitespace_and_comments();
    if (!at_end()) {
        fail("Additional text found after the end of the object: " + describe(peek()));
    }
    return root;
}

Value Parser::parse_value(size_t depth) {
    if (depth > config::kMaxNestingDepth) {
        fail("Nesting exceeds the maximum depth of " + std::to_string(config::kMaxNestingDepth));
    }

    skip_whitespace_and_comments();
    char c = peek();
    switch (c) {
        case '{': return parse_object(depth);
        case '[': return parse_array(depth);
        case '"': {
            Position start = position();
            Value v(parse_string());
            v.set_position(start);
            return v;
        }
        case 't':
        case 'f':
        case 'n':
            return parse_literal();
        default:
            if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
                return parse_number();
            }
            fail("Unexpected " + describe(c) + " while reading a value");
    }
}

Value Parser::parse_object(size_t depth) {
    Value object = Value::object();
    object.set_position(position());
    consume(); // '{'

    auto& members = object.as_object();
    std::unordered_set<std::string> seen;
    skip_whitespace_and_comments();
    if (peek() == '}') {
        consume();
        return object;
    }

    while (true) {
        skip_whitespace_and_comments();
        Position name_start = position();
        if (peek() != '"') {
            fail("Expected a property name, found " + describe(peek()));
        }
        std::string name = parse_string();
        if (!seen.insert(name).second) {
            fail("Duplicate property '" + name + "'", name_start);
        }

        skip_whitespace_and_comments();
        if (peek() != ':') {
            fail("Expected ':' after property '" + name + "', found " + describe(peek()));
        }
        consume();

        Value value = parse_value(depth + 1);
        members.emplace_back(std::move(name), std::move(value));

        skip_whitespace_and_comments();
        char c = consume();
        if (c == '}') break;
        if (c != ',') {
            fail("Expected ',' or '}' in object, found " + describe(c));
        }
    }
    return object;
}

Value Parser::parse_array(size_t depth) {
    Value array = Value::array();
    array.set_position(position());
    consume(); // '['

    skip_whitespace_and_comments();
    if (peek() == ']') {
        consume();
        return array;
    }

    while (true) {
        array.push_back(parse_value(depth + 1));

        skip_whitespace_and_comments();
        char c = consume();
        if (c == ']') break;
        if (c != ',') {
            fail("Expected ',' or ']' in array, found " + describe(c));
        }
    }
    return array;
}

char32_t Parser::parse_hex_escape() {
    char32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        int digit = hex_value(peek());
        if (digit < 0) {
            fail("Invalid \\u escape sequence");
        }
        consume();
        value = (value << 4) | static_cast<char32_t>(digit);
    }
    return value;
}

std::string Parser::parse_string() {
    Position start = position();
    consume(); // opening quote

    std::string result;
    while (true) {
        if (at_end()) {
            fail("Unterminated string", start);
        }
        char c = consume();
        if (c == '"') break;
        if (static_cast<unsigned char>(c) < 0x20) {
            fail("Unescaped control character in string");
        }
        if (c != '\\') {
            result += c;
            continue;
        }

        char escape = consume();
        switch (escape) {
            case '"':  result += '"'; break;
            case '\\': result += '\\'; break;
            case '/':  result += '/'; break;
            case 'b':  result += '\b'; break;
            case 'f':  result += '\f'; break;
            case 'n':  result += '\n'; break;
            case 'r':  result += '\r'; break;
            case 't':  result += '\t'; break;
            case 'u': {
                char32_t codepoint = parse_hex_escape();
                if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
                    if (peek() != '\\') fail("Unpaired high surrogate in \\u escape");
                    consume();
                    if (peek() != 'u') fail("Unpaired high surrogate in \\u escape");
                    consume();
                    char32_t low = parse_hex_escape();
                    if (low < 0xDC00 || low > 0xDFFF) {
                        fail("Invalid low surrogate in \\u escape");
                    }
                    codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                } else if (utf8::is_surrogate(codepoint)) {
                    fail("Unpaired low surrogate in \\u escape");
                }
                utf8::append(result, codepoint);
                break;
            }
            default:
                fail("Invalid escape sequence '\\" + std::string(1, escape) + "'");
        }
    }
    return result;
}

Value Parser::parse_number() {
    Position start = position();
    size_t begin = pos_;
    while (!at_end() && is_number_char(peek())) {
        consume();
    }

    std::string_view literal = input_.substr(begin, pos_ - begin);
    auto decimal = Decimal::parse(literal);
    if (!decimal) {
        fail("Invalid number '" + std::string(literal) + "'", start);
    }

    Value v(std::move(*decimal));
    v.set_position(start);
    return v;
}

Value Parser::parse_literal() {
    Position start = position();
    std::string word;
    while (!at_end() && std::isalpha(static_cast<unsigned char>(peek()))) {
        word += consume();
    }

    Value v;
    if (word == "true") v = Value(true);
    else if (word == "false") v = Value(false);
    else if (word == "null") v = Value(nullptr);
    else fail("Unexpected token '" + word + "'", start);

    v.set_position(start);
    return v;
}

Value parse_document(std::string_view text) {
    Parser parser(text);
    return parser.parse_document();
}

} // namespace fidelity::json
