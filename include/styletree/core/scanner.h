#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace styletree::core {

bool is_whitespace(char c);

// Forward-only cursor over a borrowed text. The text must outlive the scanner.
class Scanner {
public:
    explicit Scanner(std::string_view input);

    // Throws ParseError(OutOfBounds) when at_end().
    char peek() const;
    char advance();

    bool starts_with(std::string_view prefix) const;
    bool at_end() const;

    std::string consume_while(const std::function<bool(char)>& predicate);
    void skip_whitespace();

    std::size_t offset() const { return pos_; }

private:
    std::string_view input_;
    std::size_t pos_ = 0;

    void check_not_at_end(const char* operation) const;
};

}  // namespace styletree::core
