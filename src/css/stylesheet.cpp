#include "styletree/css/stylesheet.h"

#include <sstream>
#include <utility>

namespace styletree::css {

// ---------------------------------------------------------------------------
// Selector / Specificity
// ---------------------------------------------------------------------------

bool Selector::operator==(const Selector& other) const {
    return tag == other.tag && id == other.id && classes == other.classes;
}

bool Specificity::operator<(const Specificity& other) const {
    if (a != other.a) return a < other.a;
    if (b != other.b) return b < other.b;
    return c < other.c;
}

bool Specificity::operator==(const Specificity& other) const {
    return a == other.a && b == other.b && c == other.c;
}

Specificity compute_specificity(const Selector& selector) {
    Specificity spec;
    spec.a = selector.id.has_value() ? 1 : 0;
    spec.b = static_cast<int>(selector.classes.size());
    spec.c = selector.tag.has_value() ? 1 : 0;
    return spec;
}

// ---------------------------------------------------------------------------
// Value
// ---------------------------------------------------------------------------

Value Value::make_keyword(std::string text) {
    Value v;
    v.type = Type::Keyword;
    v.keyword = std::move(text);
    return v;
}

Value Value::make_size(double number, Unit unit) {
    Value v;
    v.type = Type::Size;
    v.number = number;
    v.unit = unit;
    return v;
}

Value Value::make_color(uint8_t r, uint8_t g, uint8_t b) {
    Value v;
    v.type = Type::Color;
    v.color = {r, g, b};
    return v;
}

bool Value::operator==(const Value& other) const {
    if (type != other.type) return false;
    switch (type) {
        case Type::Keyword: return keyword == other.keyword;
        case Type::Size:    return number == other.number && unit == other.unit;
        case Type::Color:   return color == other.color;
    }
    return false;
}

bool Declaration::operator==(const Declaration& other) const {
    return property == other.property && value == other.value;
}

bool Rule::operator==(const Rule& other) const {
    return selectors == other.selectors && declarations == other.declarations;
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

const char* unit_suffix(Unit unit) {
    switch (unit) {
        case Unit::Px:      return "px";
        case Unit::Percent: return "%";
        case Unit::Em:      return "em";
        case Unit::Rem:     return "rem";
        case Unit::None:    return "";
    }
    return "";
}

std::string serialize_value(const Value& value) {
    switch (value.type) {
        case Value::Type::Keyword:
            return value.keyword;
        case Value::Type::Size: {
            std::ostringstream oss;
            oss << value.number << unit_suffix(value.unit);
            return oss.str();
        }
        case Value::Type::Color: {
            static const char kHex[] = "0123456789abcdef";
            std::string out = "#";
            for (uint8_t channel : {value.color.r, value.color.g, value.color.b}) {
                out += kHex[channel >> 4];
                out += kHex[channel & 0x0F];
            }
            return out;
        }
    }
    return {};
}

std::string serialize_selector(const Selector& selector) {
    std::string out;
    if (selector.tag) out += *selector.tag;
    if (selector.id) out += "#" + *selector.id;
    for (const auto& cls : selector.classes) {
        out += "." + cls;
    }
    return out;
}

std::string serialize_stylesheet(const Stylesheet& sheet) {
    std::string out;
    for (const auto& rule : sheet.rules) {
        for (std::size_t i = 0; i < rule.selectors.size(); ++i) {
            if (i > 0) out += ", ";
            out += serialize_selector(rule.selectors[i]);
        }
        out += " {";
        for (const auto& decl : rule.declarations) {
            out += " " + decl.property + ": " + serialize_value(decl.value) + ";";
        }
        out += " }\n";
    }
    return out;
}

}  // namespace styletree::css
