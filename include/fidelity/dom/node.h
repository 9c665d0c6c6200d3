#pragma once
#include <fidelity/core/error.h>
#include <memory>
#include <string>
#include <vector>

namespace fidelity::dom {

enum class NodeType {
    Document, Element, Text, Comment
};

// Append-only tree node. Children are owned; parent is a back pointer.
// Every node records where it started in the source text.
class Node {
public:
    explicit Node(NodeType type) : type_(type) {}
    virtual ~Node() = default;

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    NodeType node_type() const { return type_; }
    Node* parent() const { return parent_; }
    Node* first_child() const;
    Node* last_child() const;
    size_t child_count() const { return children_.size(); }

    Node& append_child(std::unique_ptr<Node> child);

    template<typename Fn>
    void for_each_child(Fn&& fn) const {
        for (auto& child : children_) {
            fn(*child);
        }
    }

    Position position() const { return position_; }
    void set_position(Position position) { position_ = position; }

    // Concatenated character data of all descendant text nodes
    virtual std::string text_content() const;

protected:
    NodeType type_;
    Node* parent_ = nullptr;
    std::vector<std::unique_ptr<Node>> children_;
    Position position_;
};

} // namespace fidelity::dom
