#pragma once
#include <fidelity/dom/document.h>
#include <fidelity/io/writer.h>
#include <fidelity/json/value.h>
#include <string>

namespace fidelity::io {

// Emit whole trees through the streaming writers
void write_markup_node(MarkupWriter& writer, const dom::Node& node);
void write_json_value(JsonWriter& writer, const json::Value& value);

std::string to_markup_string(const dom::Document& document);
std::string to_json_string(const json::Value& value);

} // namespace fidelity::io
