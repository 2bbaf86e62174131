#include "styletree/html/dom.h"

#include "styletree/core/scanner.h"

#include <utility>

namespace styletree::html {
namespace {

void collect_by_tag(const Node& node, const std::string& tag,
                    std::vector<const Node*>& out) {
    if (node.is_element() && node.element.tag_name == tag) {
        out.push_back(&node);
    }
    for (const auto& child : node.children) {
        collect_by_tag(child, tag, out);
    }
}

void append_text(const Node& node, std::string& out) {
    switch (node.type) {
        case NodeType::Text:
            out += node.text;
            return;
        case NodeType::Element:
            for (const auto& child : node.children) {
                append_text(child, out);
            }
            return;
    }
}

}  // namespace

std::optional<std::string> ElementData::id() const {
    auto it = attributes.find("id");
    if (it == attributes.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::set<std::string> ElementData::classes() const {
    std::set<std::string> result;
    auto it = attributes.find("class");
    if (it == attributes.end()) {
        return result;
    }

    const std::string& value = it->second;
    std::size_t pos = 0;
    while (pos < value.size()) {
        while (pos < value.size() && core::is_whitespace(value[pos])) {
            ++pos;
        }
        const std::size_t start = pos;
        while (pos < value.size() && !core::is_whitespace(value[pos])) {
            ++pos;
        }
        if (pos > start) {
            result.insert(value.substr(start, pos - start));
        }
    }
    return result;
}

Node make_text(std::string content) {
    Node node;
    node.type = NodeType::Text;
    node.text = std::move(content);
    return node;
}

Node make_element(std::string tag_name, AttributeMap attributes,
                  std::vector<Node> children) {
    Node node;
    node.type = NodeType::Element;
    node.element.tag_name = std::move(tag_name);
    node.element.attributes = std::move(attributes);
    node.children = std::move(children);
    return node;
}

bool operator==(const ElementData& a, const ElementData& b) {
    return a.tag_name == b.tag_name && a.attributes == b.attributes;
}

bool operator==(const Node& a, const Node& b) {
    if (a.type != b.type) {
        return false;
    }
    switch (a.type) {
        case NodeType::Text:
            return a.text == b.text;
        case NodeType::Element:
            return a.element == b.element && a.children == b.children;
    }
    return false;
}

std::string serialize_dom(const Node& node) {
    std::string output;

    switch (node.type) {
        case NodeType::Text:
            output += "TEXT(\"" + node.text + "\")";
            return output;
        case NodeType::Element:
            output += "<" + node.element.tag_name;
            for (const auto& [key, value] : node.element.attributes) {
                output += " " + key + "=\"" + value + "\"";
            }
            output += ">";
            break;
    }

    for (const auto& child : node.children) {
        output += "[" + serialize_dom(child) + "]";
    }

    output += "</" + node.element.tag_name + ">";
    return output;
}

std::size_t count_nodes(const Node& root) {
    std::size_t count = 1;
    for (const auto& child : root.children) {
        count += count_nodes(child);
    }
    return count;
}

const Node* query_first_by_id(const Node& root, const std::string& id) {
    if (root.is_element()) {
        const auto own_id = root.element.id();
        if (own_id && *own_id == id) {
            return &root;
        }
    }
    for (const auto& child : root.children) {
        if (const Node* found = query_first_by_id(child, id)) {
            return found;
        }
    }
    return nullptr;
}

std::vector<const Node*> query_all_by_tag(const Node& root, const std::string& tag) {
    std::vector<const Node*> result;
    collect_by_tag(root, tag, result);
    return result;
}

std::string inner_text(const Node& root) {
    std::string out;
    append_text(root, out);
    return out;
}

}  // namespace styletree::html
