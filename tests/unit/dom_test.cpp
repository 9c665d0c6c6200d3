#include <fidelity/dom/document.h>
#include <gtest/gtest.h>
#include <memory>
#include <string>

using namespace fidelity::dom;

// ============================================================================
// Node tree manipulation
// ============================================================================

// 1. append_child keeps order and sets the parent
TEST(DomNode, AppendChildSetsParentAndOrder) {
    Element parent("Bundle");
    auto& first = parent.append_child(std::make_unique<Element>("entry"));
    auto& second = parent.append_child(std::make_unique<Text>("x"));

    EXPECT_EQ(parent.child_count(), 2u);
    EXPECT_EQ(parent.first_child(), &first);
    EXPECT_EQ(parent.last_child(), &second);
    EXPECT_EQ(first.parent(), &parent);
    EXPECT_EQ(second.parent(), &parent);
    EXPECT_EQ(parent.parent(), nullptr);
}

// 2. Empty nodes have no children
TEST(DomNode, EmptyNodeHasNoChildren) {
    Element empty("a");
    EXPECT_EQ(empty.child_count(), 0u);
    EXPECT_EQ(empty.first_child(), nullptr);
    EXPECT_EQ(empty.last_child(), nullptr);
    EXPECT_EQ(empty.text_content(), "");
}

// 3. text_content concatenates descendants in document order
TEST(DomNode, TextContentIsRecursive) {
    Element outer("div");
    outer.append_child(std::make_unique<Text>("a"));
    auto& inner = outer.append_child(std::make_unique<Element>("b"));
    inner.append_child(std::make_unique<Text>("b"));
    outer.append_child(std::make_unique<Text>("c"));
    EXPECT_EQ(outer.text_content(), "abc");

    int visited = 0;
    outer.for_each_child([&](const Node&) { ++visited; });
    EXPECT_EQ(visited, 3);
}

// 4. Positions default to unknown
TEST(DomNode, PositionDefaultsToUnknown) {
    Text text("x");
    EXPECT_FALSE(text.position().known());
    text.set_position({3, 7});
    EXPECT_EQ(text.position().line, 3u);
    EXPECT_EQ(text.position().column, 7u);
}

// ============================================================================
// Elements
// ============================================================================

TEST(DomElement, AttributesKeepOrderAndReplaceInPlace) {
    Element e("name");
    e.set_attribute("use", "official");
    e.set_attribute("id", "n1");
    e.set_attribute("use", "usual");

    ASSERT_EQ(e.attributes().size(), 2u);
    EXPECT_EQ(e.attributes()[0].name, "use");
    EXPECT_EQ(e.attributes()[0].value, "usual");
    EXPECT_EQ(e.get_attribute("id").value(), "n1");
    EXPECT_TRUE(e.has_attribute("id"));

    e.remove_attribute("id");
    EXPECT_FALSE(e.has_attribute("id"));
    EXPECT_FALSE(e.get_attribute("id").has_value());
}

TEST(DomElement, PrefixAndLocalName) {
    Element plain("Patient");
    EXPECT_EQ(plain.prefix(), "");
    EXPECT_EQ(plain.local_name(), "Patient");

    Element qualified("xhtml:div");
    EXPECT_EQ(qualified.prefix(), "xhtml");
    EXPECT_EQ(qualified.local_name(), "div");
}

TEST(DomElement, ChildElementNavigation) {
    Element patient("Patient");
    patient.append_child(std::make_unique<Text>("ignored"));
    patient.append_child(std::make_unique<Element>("id"));
    patient.append_child(std::make_unique<Element>("name"));
    patient.append_child(std::make_unique<Element>("name"));

    ASSERT_NE(patient.first_child_element(), nullptr);
    EXPECT_EQ(patient.first_child_element()->name(), "id");
    EXPECT_EQ(patient.first_child_element("name")->name(), "name");
    EXPECT_EQ(patient.first_child_element("gender"), nullptr);
    EXPECT_EQ(patient.child_elements("name").size(), 2u);
    EXPECT_EQ(patient.child_elements().size(), 3u);
}

TEST(DomElement, CommentsDoNotContributeText) {
    Element div("div");
    div.append_child(std::make_unique<Text>("a"));
    div.append_child(std::make_unique<Comment>("hidden"));
    div.append_child(std::make_unique<Text>("b"));
    EXPECT_EQ(div.text_content(), "ab");
}

// ============================================================================
// Document
// ============================================================================

TEST(DomDocument, DocumentElementIsFirstElementChild) {
    Document doc;
    EXPECT_EQ(doc.document_element(), nullptr);

    doc.append_child(doc.create_comment("leading"));
    auto& root = doc.append_child(doc.create_element("Observation"));
    EXPECT_EQ(doc.document_element(), &root);
    EXPECT_EQ(doc.node_type(), NodeType::Document);
    EXPECT_EQ(root.node_type(), NodeType::Element);
}

TEST(DomDocument, FactoryMethods) {
    Document doc;
    auto text = doc.create_text_node("value");
    auto comment = doc.create_comment("note");
    EXPECT_EQ(text->data(), "value");
    EXPECT_EQ(text->node_type(), NodeType::Text);
    EXPECT_EQ(comment->data(), "note");
    EXPECT_EQ(comment->node_type(), NodeType::Comment);
}
