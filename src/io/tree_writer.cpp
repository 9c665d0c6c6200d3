#include <fidelity/io/tree_writer.h>

namespace fidelity::io {

void write_markup_node(MarkupWriter& writer, const dom::Node& node) {
    switch (node.node_type()) {
        case dom::NodeType::Document:
            node.for_each_child([&](const dom::Node& child) {
                write_markup_node(writer, child);
            });
            break;
        case dom::NodeType::Element: {
            auto& element = static_cast<const dom::Element&>(node);
            writer.write_start_element(element.name());
            for (auto& attr : element.attributes()) {
                writer.write_attribute(attr.name, attr.value);
            }
            element.for_each_child([&](const dom::Node& child) {
                write_markup_node(writer, child);
            });
            writer.write_end_element();
            break;
        }
        case dom::NodeType::Text:
            writer.write_string(static_cast<const dom::Text&>(node).data());
            break;
        case dom::NodeType::Comment:
            writer.write_comment(static_cast<const dom::Comment&>(node).data());
            break;
    }
}

void write_json_value(JsonWriter& writer, const json::Value& value) {
    switch (value.type()) {
        case json::ValueType::Null:
            writer.write_null();
            break;
        case json::ValueType::Boolean:
            writer.write_bool(value.as_bool());
            break;
        case json::ValueType::Number:
            writer.write_decimal(value.as_decimal());
            break;
        case json::ValueType::String:
            writer.write_string(value.as_string());
            break;
        case json::ValueType::Array:
            writer.write_start_array();
            for (auto& item : value.as_array()) {
                write_json_value(writer, item);
            }
            writer.write_end_array();
            break;
        case json::ValueType::Object:
            writer.write_start_object();
            for (auto& [name, member] : value.as_object()) {
                writer.write_property_name(name);
                write_json_value(writer, member);
            }
            writer.write_end_object();
            break;
    }
}

std::string to_markup_string(const dom::Document& document) {
    return write_markup_to_string([&](MarkupWriter& writer) {
        write_markup_node(writer, document);
    });
}

std::string to_json_string(const json::Value& value) {
    return write_json_to_string([&](JsonWriter& writer) {
        write_json_value(writer, value);
    });
}

} // namespace fidelity::io
