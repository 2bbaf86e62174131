#pragma once

#include <string_view>
#include <vector>

#include "styletree/core/diagnostics.h"
#include "styletree/css/stylesheet.h"

namespace styletree::css {

// All functions throw core::ParseError on grammar violations.
Stylesheet parse_stylesheet(std::string_view css);
Stylesheet parse_stylesheet(std::string_view css, core::DiagnosticEmitter& diagnostics);

// Classifies a raw declaration value: '#rrggbb' -> Color, digit-led -> Size,
// anything else -> Keyword with the text kept verbatim.
Value parse_value(std::string_view raw);

// Entry points for the individual grammar productions. Input left over after
// the production is ignored.
std::vector<Selector> parse_selector_list(std::string_view input);
std::vector<Declaration> parse_declaration_block(std::string_view input);
Rule parse_rule(std::string_view input);

}  // namespace styletree::css
