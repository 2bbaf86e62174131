#pragma once

#include <string_view>

#include "styletree/core/diagnostics.h"
#include "styletree/html/dom.h"

namespace styletree::html {

// Parses exactly one root node. Callers needing several top-level siblings
// must wrap the input in a synthetic root element first.
// Throws core::ParseError on any grammar violation.
Node parse_markup(std::string_view markup);
Node parse_markup(std::string_view markup, core::DiagnosticEmitter& diagnostics);

}  // namespace styletree::html
