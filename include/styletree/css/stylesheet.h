#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace styletree::css {

// tag? (#id)? (.class)*
struct Selector {
    std::optional<std::string> tag;
    std::optional<std::string> id;
    std::vector<std::string> classes;

    bool operator==(const Selector& other) const;
};

struct Specificity {
    int a = 0;  // id present
    int b = 0;  // class tokens
    int c = 0;  // tag present

    bool operator<(const Specificity& other) const;
    bool operator==(const Specificity& other) const;
    bool operator>(const Specificity& other) const { return other < *this; }
};

Specificity compute_specificity(const Selector& selector);

enum class Unit {
    Px,
    Percent,
    Em,
    Rem,
    None,
};

struct Color {
    uint8_t r = 0, g = 0, b = 0;

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
};

struct Value {
    enum class Type { Keyword, Size, Color };

    Type type = Type::Keyword;
    std::string keyword;
    double number = 0;
    Unit unit = Unit::None;
    css::Color color;

    static Value make_keyword(std::string text);
    static Value make_size(double number, Unit unit);
    static Value make_color(uint8_t r, uint8_t g, uint8_t b);

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }
};

struct Declaration {
    std::string property;
    Value value;

    bool operator==(const Declaration& other) const;
};

struct Rule {
    std::vector<Selector> selectors;  // OR-matched
    std::vector<Declaration> declarations;

    bool operator==(const Rule& other) const;
};

// Rule order is source order and decides equal-specificity ties.
struct Stylesheet {
    std::vector<Rule> rules;
};

const char* unit_suffix(Unit unit);

std::string serialize_value(const Value& value);
std::string serialize_selector(const Selector& selector);
std::string serialize_stylesheet(const Stylesheet& sheet);

}  // namespace styletree::css
