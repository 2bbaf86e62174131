#include "styletree/core/scanner.h"

#include "styletree/core/parse_error.h"

#include <cctype>

namespace styletree::core {

bool is_whitespace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

Scanner::Scanner(std::string_view input) : input_(input) {}

void Scanner::check_not_at_end(const char* operation) const {
    if (at_end()) {
        throw ParseError(ParseErrorKind::OutOfBounds, pos_,
                         std::string(operation) + " past end of input (length " +
                             std::to_string(input_.size()) + ")");
    }
}

char Scanner::peek() const {
    check_not_at_end("peek");
    return input_[pos_];
}

char Scanner::advance() {
    check_not_at_end("advance");
    return input_[pos_++];
}

bool Scanner::starts_with(std::string_view prefix) const {
    if (at_end()) {
        return prefix.empty();
    }
    return input_.substr(pos_, prefix.size()) == prefix;
}

bool Scanner::at_end() const {
    return pos_ >= input_.size();
}

std::string Scanner::consume_while(const std::function<bool(char)>& predicate) {
    const std::size_t start = pos_;
    while (!at_end() && predicate(input_[pos_])) {
        ++pos_;
    }
    return std::string(input_.substr(start, pos_ - start));
}

void Scanner::skip_whitespace() {
    consume_while(is_whitespace);
}

}  // namespace styletree::core
