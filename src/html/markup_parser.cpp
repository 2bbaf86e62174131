#include "styletree/html/markup_parser.h"

#include "styletree/core/config.h"
#include "styletree/core/parse_error.h"
#include "styletree/core/scanner.h"

#include <cctype>
#include <string>
#include <utility>

namespace styletree::html {
namespace {

constexpr char kModule[] = "html";

bool is_tag_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

// Whitespace is allowed so a class attribute can carry several tokens.
bool is_attribute_value_char(char c) {
    return is_tag_name_char(c) || core::is_whitespace(c);
}

class MarkupParser {
public:
    explicit MarkupParser(std::string_view input) : scanner_(input) {}

    Node parse_node() {
        scanner_.skip_whitespace();
        if (scanner_.peek() == '<') {
            return parse_element();
        }
        return parse_text();
    }

private:
    core::Scanner scanner_;
    std::size_t depth_ = 0;

    [[noreturn]] void fail(core::ParseErrorKind kind, const std::string& detail) const {
        throw core::ParseError(kind, scanner_.offset(), detail);
    }

    Node parse_text() {
        return make_text(scanner_.consume_while([](char c) { return c != '<'; }));
    }

    std::string parse_tag_name() {
        return scanner_.consume_while(is_tag_name_char);
    }

    void parse_attribute(AttributeMap& attributes) {
        std::string name = parse_tag_name();
        if (name.empty()) {
            fail(core::ParseErrorKind::MalformedAttribute, "expected an attribute name");
        }
        if (scanner_.at_end() || scanner_.peek() != '=') {
            fail(core::ParseErrorKind::MalformedAttribute,
                 "expected '=' after attribute '" + name + "'");
        }
        scanner_.advance();

        if (scanner_.at_end() || (scanner_.peek() != '"' && scanner_.peek() != '\'')) {
            fail(core::ParseErrorKind::MalformedAttribute,
                 "expected opening quote for attribute '" + name + "'");
        }
        const char quote = scanner_.advance();

        std::string value = scanner_.consume_while(is_attribute_value_char);
        if (scanner_.at_end() || scanner_.peek() != quote) {
            fail(core::ParseErrorKind::MalformedAttribute,
                 "expected closing " + std::string(1, quote) + " for attribute '" + name + "'");
        }
        scanner_.advance();

        attributes[std::move(name)] = std::move(value);
    }

    AttributeMap parse_attributes() {
        AttributeMap attributes;
        while (true) {
            scanner_.skip_whitespace();
            if (scanner_.at_end()) {
                fail(core::ParseErrorKind::UnexpectedEof, "input ended inside an opening tag");
            }
            if (scanner_.peek() == '>') {
                break;
            }
            parse_attribute(attributes);
            if (!scanner_.at_end() && scanner_.peek() != '>' &&
                !core::is_whitespace(scanner_.peek())) {
                fail(core::ParseErrorKind::MalformedAttribute,
                     "expected whitespace or '>' after an attribute");
            }
        }
        return attributes;
    }

    std::vector<Node> parse_elements() {
        std::vector<Node> nodes;
        while (true) {
            scanner_.skip_whitespace();
            if (scanner_.at_end()) {
                fail(core::ParseErrorKind::UnexpectedEof, "input ended before a closing tag");
            }
            if (scanner_.starts_with("</")) {
                break;
            }
            nodes.push_back(parse_node());
        }
        return nodes;
    }

    Node parse_element() {
        if (++depth_ > core::config::kMaxNestingDepth) {
            fail(core::ParseErrorKind::NestingTooDeep,
                 "element nesting exceeds " + std::to_string(core::config::kMaxNestingDepth));
        }

        scanner_.advance();  // '<'
        std::string tag_name = parse_tag_name();
        if (tag_name.empty()) {
            fail(core::ParseErrorKind::UnclosedOrMismatchedTag, "expected a tag name after '<'");
        }
        AttributeMap attributes = parse_attributes();
        scanner_.advance();  // '>'

        std::vector<Node> children = parse_elements();

        const std::string closing = "</" + tag_name + ">";
        if (!scanner_.starts_with(closing)) {
            fail(core::ParseErrorKind::UnclosedOrMismatchedTag,
                 "expected " + closing);
        }
        for (std::size_t i = 0; i < closing.size(); ++i) {
            scanner_.advance();
        }

        --depth_;
        return make_element(std::move(tag_name), std::move(attributes), std::move(children));
    }
};

}  // namespace

Node parse_markup(std::string_view markup) {
    MarkupParser parser(markup);
    return parser.parse_node();
}

Node parse_markup(std::string_view markup, core::DiagnosticEmitter& diagnostics) {
    try {
        Node root = parse_markup(markup);
        diagnostics.emit(core::Severity::Info, kModule, "parse",
                         "parsed " + std::to_string(count_nodes(root)) + " node(s) from " +
                             std::to_string(markup.size()) + " byte(s)");
        return root;
    } catch (const core::ParseError& error) {
        diagnostics.report_failure(kModule, "parse", error);
        throw;
    }
}

}  // namespace styletree::html
