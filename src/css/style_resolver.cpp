#include "styletree/css/style_resolver.h"

#include "styletree/css/selector_matcher.h"

#include <algorithm>

namespace styletree::css {

std::vector<MatchedRule> matching_rules(const html::ElementData& element,
                                        const Stylesheet& sheet) {
    std::vector<MatchedRule> result;
    for (const auto& rule : sheet.rules) {
        if (const Selector* selector = first_matching_selector(element, rule)) {
            result.push_back({compute_specificity(*selector), &rule});
        }
    }
    return result;
}

PropertyMap cascade(const html::ElementData& element, const Stylesheet& sheet) {
    std::vector<MatchedRule> matched = matching_rules(element, sheet);
    std::stable_sort(matched.begin(), matched.end(),
                     [](const MatchedRule& lhs, const MatchedRule& rhs) {
                         return lhs.specificity < rhs.specificity;
                     });

    PropertyMap properties;
    for (const auto& entry : matched) {
        for (const auto& decl : entry.rule->declarations) {
            properties[decl.property] = decl.value;
        }
    }
    return properties;
}

StyledNode style_tree(const html::Node& node, const Stylesheet& sheet) {
    StyledNode styled;
    styled.node = &node;

    switch (node.type) {
        case html::NodeType::Text:
            break;
        case html::NodeType::Element:
            styled.properties = cascade(node.element, sheet);
            styled.children.reserve(node.children.size());
            for (const auto& child : node.children) {
                styled.children.push_back(style_tree(child, sheet));
            }
            break;
    }
    return styled;
}

std::string serialize_styled_tree(const StyledNode& styled) {
    std::string output;
    if (styled.node == nullptr) {
        return output;
    }

    switch (styled.node->type) {
        case html::NodeType::Text:
            return "TEXT(\"" + styled.node->text + "\")";
        case html::NodeType::Element:
            output += "<" + styled.node->element.tag_name;
            if (!styled.properties.empty()) {
                output += " {";
                bool first = true;
                for (const auto& [property, value] : styled.properties) {
                    output += first ? "" : " ";
                    output += property + ": " + serialize_value(value) + ";";
                    first = false;
                }
                output += "}";
            }
            output += ">";
            break;
    }

    for (const auto& child : styled.children) {
        output += "[" + serialize_styled_tree(child) + "]";
    }
    output += "</" + styled.node->element.tag_name + ">";
    return output;
}

}  // namespace styletree::css
