#pragma once
#include <fidelity/dom/node.h>

namespace fidelity::dom {

class Comment : public Node {
public:
    explicit Comment(const std::string& data);
    const std::string& data() const { return data_; }
    void set_data(const std::string& data) { data_ = data; }
    // Comments do not contribute to text content
    std::string text_content() const override { return {}; }
private:
    std::string data_;
};

} // namespace fidelity::dom
