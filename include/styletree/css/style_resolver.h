#pragma once

#include <map>
#include <string>
#include <vector>

#include "styletree/css/stylesheet.h"
#include "styletree/html/dom.h"

namespace styletree::css {

using PropertyMap = std::map<std::string, Value>;

struct MatchedRule {
    Specificity specificity;
    const Rule* rule;
};

// Mirrors one html::Node, which must outlive it.
struct StyledNode {
    const html::Node* node = nullptr;
    PropertyMap properties;
    std::vector<StyledNode> children;
};

// Matching rules in stylesheet order; each rule appears at most once, weighted
// by the first of its selectors that matches.
std::vector<MatchedRule> matching_rules(const html::ElementData& element,
                                        const Stylesheet& sheet);

// Folds the declarations of all matching rules, lowest specificity first and
// source order within equal specificity, later writes winning.
PropertyMap cascade(const html::ElementData& element, const Stylesheet& sheet);

StyledNode style_tree(const html::Node& node, const Stylesheet& sheet);
// A temporary document would leave every StyledNode::node dangling.
StyledNode style_tree(const html::Node&& node, const Stylesheet& sheet) = delete;

std::string serialize_styled_tree(const StyledNode& styled);

}  // namespace styletree::css
