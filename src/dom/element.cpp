#include <fidelity/dom/element.h>
#include <algorithm>

namespace fidelity::dom {

Element::Element(const std::string& name)
    : Node(NodeType::Element)
    , name_(name) {}

std::string_view Element::prefix() const {
    auto colon = name_.find(':');
    if (colon == std::string::npos) return {};
    return std::string_view(name_).substr(0, colon);
}

std::string_view Element::local_name() const {
    auto colon = name_.find(':');
    if (colon == std::string::npos) return name_;
    return std::string_view(name_).substr(colon + 1);
}

std::optional<std::string> Element::get_attribute(std::string_view name) const {
    for (auto& attr : attributes_) {
        if (attr.name == name) {
            return attr.value;
        }
    }
    return std::nullopt;
}

void Element::set_attribute(const std::string& name, const std::string& value) {
    for (auto& attr : attributes_) {
        if (attr.name == name) {
            attr.value = value;
            return;
        }
    }
    attributes_.push_back({name, value, {}});
}

void Element::remove_attribute(std::string_view name) {
    auto it = std::remove_if(attributes_.begin(), attributes_.end(),
        [name](const Attribute& a) { return a.name == name; });
    attributes_.erase(it, attributes_.end());
}

bool Element::has_attribute(std::string_view name) const {
    return std::any_of(attributes_.begin(), attributes_.end(),
        [name](const Attribute& a) { return a.name == name; });
}

Element* Element::first_child_element(std::string_view name) const {
    for (auto& child : children_) {
        if (child->node_type() != NodeType::Element) continue;
        auto* elem = static_cast<Element*>(child.get());
        if (name.empty() || elem->name() == name) {
            return elem;
        }
    }
    return nullptr;
}

std::vector<Element*> Element::child_elements(std::string_view name) const {
    std::vector<Element*> result;
    for (auto& child : children_) {
        if (child->node_type() != NodeType::Element) continue;
        auto* elem = static_cast<Element*>(child.get());
        if (name.empty() || elem->name() == name) {
            result.push_back(elem);
        }
    }
    return result;
}

} // namespace fidelity::dom
