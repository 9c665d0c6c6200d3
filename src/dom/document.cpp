#include <fidelity/dom/document.h>

namespace fidelity::dom {

Document::Document() : Node(NodeType::Document) {}

Element* Document::document_element() const {
    for (auto& child : children_) {
        if (child->node_type() == NodeType::Element) {
            return static_cast<Element*>(child.get());
        }
    }
    return nullptr;
}

std::unique_ptr<Element> Document::create_element(const std::string& name) {
    return std::make_unique<Element>(name);
}

std::unique_ptr<Text> Document::create_text_node(const std::string& data) {
    return std::make_unique<Text>(data);
}

std::unique_ptr<Comment> Document::create_comment(const std::string& data) {
    return std::make_unique<Comment>(data);
}

} // namespace fidelity::dom
