#include "styletree/css/selector_matcher.h"

namespace styletree::css {

bool matches(const html::ElementData& element, const Selector& selector) {
    if (selector.tag && *selector.tag != element.tag_name) {
        return false;
    }

    if (selector.id) {
        const auto element_id = element.id();
        if (!element_id || *element_id != *selector.id) {
            return false;
        }
    }

    if (!selector.classes.empty()) {
        const auto element_classes = element.classes();
        for (const auto& cls : selector.classes) {
            if (element_classes.count(cls) == 0) {
                return false;
            }
        }
    }

    return true;
}

const Selector* first_matching_selector(const html::ElementData& element, const Rule& rule) {
    for (const auto& selector : rule.selectors) {
        if (matches(element, selector)) {
            return &selector;
        }
    }
    return nullptr;
}

}  // namespace styletree::css
