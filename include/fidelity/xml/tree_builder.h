#pragma once
#include <fidelity/dom/document.h>
#include <fidelity/xml/tokenizer.h>
#include <memory>
#include <string_view>
#include <vector>

namespace fidelity::xml {

struct ParseOptions {
    bool ignore_comments = true;
};

// Builds a dom::Document from tokens, enforcing the well-formedness rules the
// tokenizer cannot see: tag matching, a single root element, no character
// data outside it. Whitespace-only text is dropped, processing instructions
// are dropped, comments are kept only when ignore_comments is false.
class TreeBuilder {
public:
    explicit TreeBuilder(const ParseOptions& options = {});

    void process_token(const Token& token);

    bool finished() const { return finished_; }

    // Only valid after EndOfFile has been processed
    std::unique_ptr<dom::Document> take_document();

private:
    ParseOptions options_;
    std::unique_ptr<dom::Document> document_;
    std::vector<dom::Element*> open_elements_;
    bool root_seen_ = false;
    bool finished_ = false;

    dom::Node& current_node();

    void handle_start_tag(const Token& token);
    void handle_end_tag(const Token& token);
    void handle_text(const Token& token);
    void handle_comment(const Token& token);
    void handle_end_of_file(const Token& token);
};

// Tokenize and build in one go. Input must already be free of a byte order
// mark; the caller is expected to have run it through the sanitizer.
std::unique_ptr<dom::Document> parse_document(std::string_view text, const ParseOptions& options = {});

} // namespace fidelity::xml
