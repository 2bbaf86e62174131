#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace styletree::core {

enum class ParseErrorKind {
    OutOfBounds,
    UnexpectedEof,
    MalformedAttribute,
    UnclosedOrMismatchedTag,
    InvalidColor,
    InvalidNumber,
    MalformedDeclaration,
    UnterminatedBlock,
    NestingTooDeep,
};

const char* error_kind_name(ParseErrorKind kind);

class ParseError : public std::runtime_error {
public:
    ParseError(ParseErrorKind kind, std::size_t offset, const std::string& detail);

    ParseErrorKind kind() const { return kind_; }
    // Byte offset in the source text where the failure was detected.
    std::size_t offset() const { return offset_; }
    const std::string& detail() const { return detail_; }

private:
    ParseErrorKind kind_;
    std::size_t offset_;
    std::string detail_;
};

}  // namespace styletree::core
