#include <fidelity/dom/text.h>

namespace fidelity::dom {

Text::Text(const std::string& data)
    : Node(NodeType::Text)
    , data_(data) {}

} // namespace fidelity::dom
