#include <fidelity/xml/tree_builder.h>
#include <fidelity/core/config.h>

namespace fidelity::xml {

TreeBuilder::TreeBuilder(const ParseOptions& options)
    : options_(options)
    , document_(std::make_unique<dom::Document>()) {
    document_->set_position({1, 1});
}

dom::Node& TreeBuilder::current_node() {
    if (open_elements_.empty()) return *document_;
    return *open_elements_.back();
}

void TreeBuilder::process_token(const Token& token) {
    if (finished_) {
        throw FormatError(kErrorPrefix, "Token after end of document", token.position);
    }

    switch (token.type) {
        case Token::XmlDeclaration:
        case Token::ProcessingInstruction:
            break;
        case Token::StartTag:
            handle_start_tag(token);
            break;
        case Token::EndTag:
            handle_end_tag(token);
            break;
        case Token::Character:
        case Token::CData:
            handle_text(token);
            break;
        case Token::Comment:
            handle_comment(token);
            break;
        case Token::EndOfFile:
            handle_end_of_file(token);
            break;
    }
}

void TreeBuilder::handle_start_tag(const Token& token) {
    if (open_elements_.empty() && root_seen_) {
        throw FormatError(kErrorPrefix,
            "There are multiple root elements; '" + token.name + "' follows the document element",
            token.position);
    }
    if (open_elements_.size() >= config::kMaxNestingDepth) {
        throw FormatError(kErrorPrefix,
            "Element nesting exceeds the maximum depth of " + std::to_string(config::kMaxNestingDepth),
            token.position);
    }

    auto element = document_->create_element(token.name);
    element->set_position(token.position);
    for (auto& attr : token.attributes) {
        element->add_attribute({attr.name, attr.value, attr.position});
    }

    auto& inserted = static_cast<dom::Element&>(current_node().append_child(std::move(element)));
    root_seen_ = true;
    if (!token.self_closing) {
        open_elements_.push_back(&inserted);
    }
}

void TreeBuilder::handle_end_tag(const Token& token) {
    if (open_elements_.empty()) {
        throw FormatError(kErrorPrefix,
            "Unexpected end tag '" + token.name + "' with no open element", token.position);
    }

    dom::Element* open = open_elements_.back();
    if (open->name() != token.name) {
        Position opened = open->position();
        throw FormatError(kErrorPrefix,
            "The '" + open->name() + "' start tag on line " + std::to_string(opened.line) +
            " position " + std::to_string(opened.column) +
            " does not match the end tag of '" + token.name + "'",
            token.position);
    }
    open_elements_.pop_back();
}

void TreeBuilder::handle_text(const Token& token) {
    bool cdata = token.type == Token::CData;

    if (open_elements_.empty()) {
        if (!cdata && token.whitespace_only) return;
        throw FormatError(kErrorPrefix, "Data at the root level is invalid", token.position);
    }
    if (!cdata && token.whitespace_only) return;

    dom::Node& parent = current_node();
    dom::Node* last = parent.last_child();
    if (last && last->node_type() == dom::NodeType::Text) {
        // Adjacent text and CDATA runs form one text node
        static_cast<dom::Text*>(last)->append_data(token.data);
        return;
    }

    auto text = document_->create_text_node(token.data);
    text->set_position(token.position);
    parent.append_child(std::move(text));
}

void TreeBuilder::handle_comment(const Token& token) {
    if (options_.ignore_comments) return;

    auto comment = document_->create_comment(token.data);
    comment->set_position(token.position);
    current_node().append_child(std::move(comment));
}

void TreeBuilder::handle_end_of_file(const Token& token) {
    if (!open_elements_.empty()) {
        dom::Element* open = open_elements_.back();
        throw FormatError(kErrorPrefix,
            "Unexpected end of file; element '" + open->name() + "' opened on line " +
            std::to_string(open->position().line) + " is not closed",
            token.position);
    }
    if (!root_seen_) {
        throw FormatError(kErrorPrefix, "Root element is missing", token.position);
    }
    finished_ = true;
}

std::unique_ptr<dom::Document> TreeBuilder::take_document() {
    if (!finished_) {
        throw FormatError(kErrorPrefix, "Document is incomplete");
    }
    return std::move(document_);
}

std::unique_ptr<dom::Document> parse_document(std::string_view text, const ParseOptions& options) {
    check_characters(text);

    Tokenizer tokenizer(text);
    TreeBuilder builder(options);
    while (!builder.finished()) {
        builder.process_token(tokenizer.next_token());
    }
    return builder.take_document();
}

} // namespace fidelity::xml
