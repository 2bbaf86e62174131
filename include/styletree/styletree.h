#pragma once

#include <string_view>

#include "styletree/core/diagnostics.h"
#include "styletree/core/parse_error.h"
#include "styletree/css/css_parser.h"
#include "styletree/css/style_resolver.h"
#include "styletree/css/stylesheet.h"
#include "styletree/html/dom.h"
#include "styletree/html/markup_parser.h"

namespace styletree {

// Text -> Document Tree. Throws core::ParseError.
html::Node parse_markup(std::string_view text);
html::Node parse_markup(std::string_view text, core::DiagnosticEmitter& diagnostics);

// Text -> ordered Stylesheet. Throws core::ParseError.
css::Stylesheet parse_stylesheet(std::string_view text);
css::Stylesheet parse_stylesheet(std::string_view text, core::DiagnosticEmitter& diagnostics);

// Never fails. The returned tree borrows `root`.
css::StyledNode resolve_styles(const html::Node& root, const css::Stylesheet& sheet);
css::StyledNode resolve_styles(const html::Node& root, const css::Stylesheet& sheet,
                               core::DiagnosticEmitter& diagnostics);
css::StyledNode resolve_styles(const html::Node&& root, const css::Stylesheet& sheet) = delete;
css::StyledNode resolve_styles(const html::Node&& root, const css::Stylesheet& sheet,
                               core::DiagnosticEmitter& diagnostics) = delete;

}  // namespace styletree
