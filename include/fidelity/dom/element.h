#pragma once
#include <fidelity/dom/node.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fidelity::dom {

struct Attribute {
    std::string name;   // qualified, e.g. "xml:lang" or "xmlns"
    std::string value;
    Position position;
};

class Element : public Node {
public:
    explicit Element(const std::string& name);

    // Qualified name as written in the source
    const std::string& name() const { return name_; }
    std::string_view prefix() const;
    std::string_view local_name() const;

    // Attributes keep source order
    std::optional<std::string> get_attribute(std::string_view name) const;
    void set_attribute(const std::string& name, const std::string& value);
    void remove_attribute(std::string_view name);
    bool has_attribute(std::string_view name) const;
    const std::vector<Attribute>& attributes() const { return attributes_; }
    void add_attribute(Attribute attribute) { attributes_.push_back(std::move(attribute)); }

    // Child element navigation
    Element* first_child_element(std::string_view name = {}) const;
    std::vector<Element*> child_elements(std::string_view name = {}) const;

private:
    std::string name_;
    std::vector<Attribute> attributes_;
};

} // namespace fidelity::dom
