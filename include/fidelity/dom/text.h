#pragma once
#include <fidelity/dom/node.h>
#include <string_view>

namespace fidelity::dom {

class Text : public Node {
public:
    explicit Text(const std::string& data);
    const std::string& data() const { return data_; }
    void set_data(const std::string& data) { data_ = data; }
    void append_data(std::string_view data) { data_.append(data); }
    std::string text_content() const override { return data_; }
private:
    std::string data_;
};

} // namespace fidelity::dom
