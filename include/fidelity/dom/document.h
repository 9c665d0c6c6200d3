#pragma once
#include <fidelity/dom/comment.h>
#include <fidelity/dom/element.h>
#include <fidelity/dom/text.h>

namespace fidelity::dom {

class Document : public Node {
public:
    Document();

    // The single root element, or nullptr for an empty document
    Element* document_element() const;

    std::unique_ptr<Element> create_element(const std::string& name);
    std::unique_ptr<Text> create_text_node(const std::string& data);
    std::unique_ptr<Comment> create_comment(const std::string& data);
};

} // namespace fidelity::dom
