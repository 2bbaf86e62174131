#pragma once

#include "styletree/css/stylesheet.h"
#include "styletree/html/dom.h"

namespace styletree::css {

// Tag, id and class constraints must all hold. A selector with no
// constraints matches every element.
bool matches(const html::ElementData& element, const Selector& selector);

// First selector of the rule that matches, or nullptr.
const Selector* first_matching_selector(const html::ElementData& element, const Rule& rule);

}  // namespace styletree::css
