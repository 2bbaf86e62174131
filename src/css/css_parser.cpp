#include "styletree/css/css_parser.h"

#include "styletree/core/parse_error.h"
#include "styletree/core/scanner.h"

#include <cctype>
#include <charconv>
#include <string>
#include <system_error>
#include <utility>

namespace styletree::css {
namespace {

constexpr char kModule[] = "css";

bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '_';
}

bool is_identifier_initial_char(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

bool is_hex_digit(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    return 10 + (c - 'A');
}

bool ends_with(std::string_view value, std::string_view suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

Value parse_color_value(std::string_view raw) {
    if (raw.size() != 7) {
        throw core::ParseError(core::ParseErrorKind::InvalidColor, 0,
                               "expected 6 hex digits in '" + std::string(raw) + "'");
    }
    for (std::size_t i = 1; i < raw.size(); ++i) {
        if (!is_hex_digit(raw[i])) {
            throw core::ParseError(core::ParseErrorKind::InvalidColor, i,
                                   "'" + std::string(1, raw[i]) + "' is not a hex digit");
        }
    }
    auto channel = [&raw](std::size_t at) {
        return static_cast<uint8_t>(hex_value(raw[at]) * 16 + hex_value(raw[at + 1]));
    };
    return Value::make_color(channel(1), channel(3), channel(5));
}

Value parse_size_value(std::string_view raw) {
    struct Suffix {
        std::string_view text;
        Unit unit;
    };
    // "rem" must be tested before "em".
    static constexpr Suffix kSuffixes[] = {
        {"px", Unit::Px},
        {"%", Unit::Percent},
        {"rem", Unit::Rem},
        {"em", Unit::Em},
    };

    std::string_view number_text = raw;
    Unit unit = Unit::None;
    for (const auto& suffix : kSuffixes) {
        if (ends_with(raw, suffix.text)) {
            number_text = raw.substr(0, raw.size() - suffix.text.size());
            unit = suffix.unit;
            break;
        }
    }

    double number = 0;
    const char* begin = number_text.data();
    const char* end = begin + number_text.size();
    const std::from_chars_result result = std::from_chars(begin, end, number);
    if (result.ec != std::errc() || result.ptr != end) {
        throw core::ParseError(core::ParseErrorKind::InvalidNumber,
                               static_cast<std::size_t>(result.ptr - begin),
                               "cannot read a number from '" + std::string(raw) + "'");
    }
    return Value::make_size(number, unit);
}

class CssParser {
public:
    explicit CssParser(std::string_view input) : scanner_(input) {}

    Stylesheet parse_stylesheet() {
        Stylesheet sheet;
        while (true) {
            scanner_.skip_whitespace();
            if (scanner_.at_end()) {
                break;
            }
            sheet.rules.push_back(parse_rule());
        }
        return sheet;
    }

    Rule parse_rule() {
        Rule rule;
        rule.selectors = parse_selector_list();
        scanner_.skip_whitespace();
        rule.declarations = parse_declaration_block();
        return rule;
    }

    std::vector<Selector> parse_selector_list() {
        std::vector<Selector> selectors;
        while (true) {
            scanner_.skip_whitespace();
            selectors.push_back(parse_selector());
            scanner_.skip_whitespace();
            if (scanner_.at_end() || scanner_.peek() != ',') {
                break;
            }
            scanner_.advance();
        }
        return selectors;
    }

    std::vector<Declaration> parse_declaration_block() {
        if (scanner_.at_end() || scanner_.peek() != '{') {
            fail(core::ParseErrorKind::UnterminatedBlock, "expected '{'");
        }
        scanner_.advance();

        std::vector<Declaration> declarations;
        while (true) {
            scanner_.skip_whitespace();
            if (scanner_.at_end()) {
                fail(core::ParseErrorKind::UnterminatedBlock, "expected '}' before end of input");
            }
            if (scanner_.peek() == '}') {
                scanner_.advance();
                break;
            }
            declarations.push_back(parse_declaration());
        }
        return declarations;
    }

private:
    core::Scanner scanner_;

    [[noreturn]] void fail(core::ParseErrorKind kind, const std::string& detail) const {
        throw core::ParseError(kind, scanner_.offset(), detail);
    }

    std::string parse_identifier() {
        return scanner_.consume_while(is_identifier_char);
    }

    Selector parse_selector() {
        Selector selector;
        while (!scanner_.at_end()) {
            const char c = scanner_.peek();
            if (c == '#') {
                scanner_.advance();
                selector.id = parse_identifier();
            } else if (c == '.') {
                scanner_.advance();
                selector.classes.push_back(parse_identifier());
            } else if (is_identifier_initial_char(c)) {
                std::string tag = parse_identifier();
                if (!selector.tag) {
                    selector.tag = std::move(tag);
                }
            } else {
                break;
            }
        }
        return selector;
    }

    Declaration parse_declaration() {
        Declaration decl;
        decl.property = parse_identifier();
        if (decl.property.empty()) {
            fail(core::ParseErrorKind::MalformedDeclaration, "expected a property name");
        }

        scanner_.skip_whitespace();
        if (scanner_.at_end() || scanner_.peek() != ':') {
            fail(core::ParseErrorKind::MalformedDeclaration,
                 "expected ':' after '" + decl.property + "'");
        }
        scanner_.advance();
        scanner_.skip_whitespace();

        const std::size_t value_offset = scanner_.offset();
        const std::string raw = scanner_.consume_while([](char c) { return c != ';'; });
        if (scanner_.at_end()) {
            fail(core::ParseErrorKind::MalformedDeclaration,
                 "expected ';' after value of '" + decl.property + "'");
        }
        scanner_.advance();

        try {
            decl.value = parse_value(raw);
        } catch (const core::ParseError& error) {
            // Rebase the value-relative offset onto the stylesheet source.
            throw core::ParseError(error.kind(), value_offset + error.offset(), error.detail());
        }
        return decl;
    }
};

}  // namespace

Value parse_value(std::string_view raw) {
    if (raw.empty()) {
        return Value::make_keyword(std::string());
    }
    if (raw.front() == '#') {
        return parse_color_value(raw);
    }
    if (std::isdigit(static_cast<unsigned char>(raw.front())) != 0) {
        return parse_size_value(raw);
    }
    return Value::make_keyword(std::string(raw));
}

Stylesheet parse_stylesheet(std::string_view css) {
    CssParser parser(css);
    return parser.parse_stylesheet();
}

Stylesheet parse_stylesheet(std::string_view css, core::DiagnosticEmitter& diagnostics) {
    try {
        Stylesheet sheet = parse_stylesheet(css);
        std::size_t declaration_count = 0;
        for (const auto& rule : sheet.rules) {
            declaration_count += rule.declarations.size();
        }
        diagnostics.emit(core::Severity::Info, kModule, "parse",
                         "parsed " + std::to_string(sheet.rules.size()) + " rule(s) with " +
                             std::to_string(declaration_count) + " declaration(s)");
        return sheet;
    } catch (const core::ParseError& error) {
        diagnostics.report_failure(kModule, "parse", error);
        throw;
    }
}

std::vector<Selector> parse_selector_list(std::string_view input) {
    CssParser parser(input);
    return parser.parse_selector_list();
}

std::vector<Declaration> parse_declaration_block(std::string_view input) {
    CssParser parser(input);
    return parser.parse_declaration_block();
}

Rule parse_rule(std::string_view input) {
    CssParser parser(input);
    return parser.parse_rule();
}

}  // namespace styletree::css
