#include <fidelity/dom/comment.h>

namespace fidelity::dom {

Comment::Comment(const std::string& data)
    : Node(NodeType::Comment)
    , data_(data) {}

} // namespace fidelity::dom
