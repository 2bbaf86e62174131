#include "styletree/core/parse_error.h"

namespace styletree::core {
namespace {

std::string format_message(ParseErrorKind kind, std::size_t offset,
                           const std::string& detail) {
    std::string message = error_kind_name(kind);
    message += " at offset " + std::to_string(offset);
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return message;
}

}  // namespace

const char* error_kind_name(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::OutOfBounds:             return "out-of-bounds";
        case ParseErrorKind::UnexpectedEof:           return "unexpected-eof";
        case ParseErrorKind::MalformedAttribute:      return "malformed-attribute";
        case ParseErrorKind::UnclosedOrMismatchedTag: return "unclosed-or-mismatched-tag";
        case ParseErrorKind::InvalidColor:            return "invalid-color";
        case ParseErrorKind::InvalidNumber:           return "invalid-number";
        case ParseErrorKind::MalformedDeclaration:    return "malformed-declaration";
        case ParseErrorKind::UnterminatedBlock:       return "unterminated-block";
        case ParseErrorKind::NestingTooDeep:          return "nesting-too-deep";
    }
    return "unknown";
}

ParseError::ParseError(ParseErrorKind kind, std::size_t offset, const std::string& detail)
    : std::runtime_error(format_message(kind, offset, detail)),
      kind_(kind),
      offset_(offset),
      detail_(detail) {}

}  // namespace styletree::core
