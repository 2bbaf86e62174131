#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace styletree::html {

enum class NodeType {
    Element,
    Text,
};

using AttributeMap = std::map<std::string, std::string>;

struct ElementData {
    std::string tag_name;
    AttributeMap attributes;

    std::optional<std::string> id() const;
    // Whitespace-separated tokens of the "class" attribute.
    std::set<std::string> classes() const;
};

// A Text node uses only `text`; an Element node uses `element` and `children`.
struct Node {
    NodeType type = NodeType::Text;
    std::string text;
    ElementData element;
    std::vector<Node> children;

    bool is_element() const { return type == NodeType::Element; }
    bool is_text() const { return type == NodeType::Text; }
};

Node make_text(std::string content);
Node make_element(std::string tag_name, AttributeMap attributes,
                  std::vector<Node> children = {});

bool operator==(const ElementData& a, const ElementData& b);
bool operator==(const Node& a, const Node& b);
inline bool operator!=(const Node& a, const Node& b) { return !(a == b); }

// Serialize DOM tree to a canonical string for deterministic comparison
std::string serialize_dom(const Node& node);

std::size_t count_nodes(const Node& root);

const Node* query_first_by_id(const Node& root, const std::string& id);
std::vector<const Node*> query_all_by_tag(const Node& root, const std::string& tag);

std::string inner_text(const Node& root);

}  // namespace styletree::html
