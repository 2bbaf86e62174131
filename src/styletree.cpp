#include "styletree/styletree.h"

#include <string>

namespace styletree {

html::Node parse_markup(std::string_view text) {
    return html::parse_markup(text);
}

html::Node parse_markup(std::string_view text, core::DiagnosticEmitter& diagnostics) {
    return html::parse_markup(text, diagnostics);
}

css::Stylesheet parse_stylesheet(std::string_view text) {
    return css::parse_stylesheet(text);
}

css::Stylesheet parse_stylesheet(std::string_view text, core::DiagnosticEmitter& diagnostics) {
    return css::parse_stylesheet(text, diagnostics);
}

css::StyledNode resolve_styles(const html::Node& root, const css::Stylesheet& sheet) {
    return css::style_tree(root, sheet);
}

css::StyledNode resolve_styles(const html::Node& root, const css::Stylesheet& sheet,
                               core::DiagnosticEmitter& diagnostics) {
    css::StyledNode styled = css::style_tree(root, sheet);
    diagnostics.emit(core::Severity::Info, "style", "resolve",
                     "styled " + std::to_string(html::count_nodes(root)) + " node(s) against " +
                         std::to_string(sheet.rules.size()) + " rule(s)");
    return styled;
}

}  // namespace styletree
