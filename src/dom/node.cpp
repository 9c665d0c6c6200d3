#include <fidelity/dom/node.h>

namespace fidelity::dom {

Node* Node::first_child() const {
    return children_.empty() ? nullptr : children_.front().get();
}

Node* Node::last_child() const {
    return children_.empty() ? nullptr : children_.back().get();
}

Node& Node::append_child(std::unique_ptr<Node> child) {
    child->parent_ = this;
    children_.push_back(std::move(child));
    return *children_.back();
}

std::string Node::text_content() const {
    std::string result;
    for_each_child([&](const Node& child) {
        result += child.text_content();
    });
    return result;
}

} // namespace fidelity::dom
