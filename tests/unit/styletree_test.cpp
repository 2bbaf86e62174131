#include <gtest/gtest.h>
#include "styletree/styletree.h"

#include <string>
#include <type_traits>
#include <utility>

namespace st = styletree;

TEST(StyletreeTest, EndToEndIdBeatsClass) {
    const auto root = st::parse_markup("<div id=\"x\" class=\"a b\"><p>hi</p></div>");
    const auto sheet = st::parse_stylesheet("#x{display:block;} .a{color:red;} p{color:blue;}");
    const auto styled = st::resolve_styles(root, sheet);

    ASSERT_EQ(styled.properties.size(), 2u);
    EXPECT_EQ(styled.properties.at("display"), st::css::Value::make_keyword("block"));
    EXPECT_EQ(styled.properties.at("color"), st::css::Value::make_keyword("red"));

    ASSERT_EQ(styled.children.size(), 1u);
    const auto& p = styled.children[0];
    ASSERT_EQ(p.properties.size(), 1u);
    EXPECT_EQ(p.properties.at("color"), st::css::Value::make_keyword("blue"));

    ASSERT_EQ(p.children.size(), 1u);
    EXPECT_TRUE(p.children[0].properties.empty());
    EXPECT_EQ(p.children[0].node->text, "hi");
}

TEST(StyletreeTest, SourceOrderTieBreak) {
    const auto root = st::parse_markup("<a></a>");
    const auto sheet = st::parse_stylesheet("a{color:red;} a{color:blue;}");
    const auto styled = st::resolve_styles(root, sheet);
    EXPECT_EQ(styled.properties.at("color"), st::css::Value::make_keyword("blue"));
}

TEST(StyletreeTest, DocumentWithSeveralRulesAndValueKinds) {
    const std::string markup =
        "<body>\n"
        "  <h1 class=\"title\">Heading</h1>\n"
        "  <div id=\"content\" class=\"box wide\">\n"
        "    <p class=\"note\">first</p>\n"
        "    <p>second</p>\n"
        "  </div>\n"
        "</body>";
    const std::string css =
        "body { margin: 0; font-family: serif; }\n"
        "h1.title, .note { font-size: 2em; }\n"
        "div.box { width: 80%; background: #fafafa; }\n"
        ".box.wide { width: 960px; }\n"
        "#content { padding: 1.5rem; }\n"
        "p { color: black; font-size: 12px; }\n";

    const auto root = st::parse_markup(markup);
    const auto sheet = st::parse_stylesheet(css);
    const auto styled = st::resolve_styles(root, sheet);

    using st::css::Unit;
    using st::css::Value;

    EXPECT_EQ(styled.properties.at("margin"), Value::make_size(0, Unit::None));
    EXPECT_EQ(styled.properties.at("font-family"), Value::make_keyword("serif"));

    ASSERT_EQ(styled.children.size(), 2u);
    const auto& h1 = styled.children[0];
    EXPECT_EQ(h1.properties.at("font-size"), Value::make_size(2, Unit::Em));

    const auto& div = styled.children[1];
    // (0,2,0) beats (0,1,1); the id rule adds padding.
    EXPECT_EQ(div.properties.at("width"), Value::make_size(960, Unit::Px));
    EXPECT_EQ(div.properties.at("background"), Value::make_color(0xfa, 0xfa, 0xfa));
    EXPECT_EQ(div.properties.at("padding"), Value::make_size(1.5, Unit::Rem));

    ASSERT_EQ(div.children.size(), 2u);
    // .note (0,1,0) beats p (0,0,1) although p comes later.
    EXPECT_EQ(div.children[0].properties.at("font-size"), Value::make_size(2, Unit::Em));
    EXPECT_EQ(div.children[0].properties.at("color"), Value::make_keyword("black"));
    EXPECT_EQ(div.children[1].properties.at("font-size"), Value::make_size(12, Unit::Px));
}

TEST(StyletreeTest, ResolutionIsDeterministic) {
    const std::string markup = "<ul><li class=\"a\">1</li><li id=\"b\">2</li></ul>";
    const std::string css = "li { color: red; } .a { color: green; } #b { color: blue; }";

    const auto root1 = st::parse_markup(markup);
    const auto root2 = st::parse_markup(markup);
    const auto sheet = st::parse_stylesheet(css);

    EXPECT_EQ(st::css::serialize_styled_tree(st::resolve_styles(root1, sheet)),
              st::css::serialize_styled_tree(st::resolve_styles(root2, sheet)));
}

TEST(StyletreeTest, DiagnosticsCoverTheWholePipeline) {
    st::core::DiagnosticEmitter diagnostics;
    const auto root = st::parse_markup("<p class=\"x\">hi</p>", diagnostics);
    const auto sheet = st::parse_stylesheet(".x { color: red; }", diagnostics);
    st::resolve_styles(root, sheet, diagnostics);

    EXPECT_EQ(diagnostics.size(), 3u);
    EXPECT_EQ(diagnostics.events_by_module("html").size(), 1u);
    EXPECT_EQ(diagnostics.events_by_module("css").size(), 1u);
    ASSERT_EQ(diagnostics.events_by_module("style").size(), 1u);
    EXPECT_EQ(diagnostics.events_by_module("style")[0].message,
              "styled 2 node(s) against 1 rule(s)");
    EXPECT_FALSE(diagnostics.has_errors());
}

TEST(StyletreeTest, ParseErrorsSurfaceThroughPublicApi) {
    EXPECT_THROW(st::parse_markup("<div></span>"), st::core::ParseError);
    EXPECT_THROW(st::parse_stylesheet("p { color: red }"), st::core::ParseError);
}

namespace {

template <typename Root, typename = void>
struct can_resolve : std::false_type {};

template <typename Root>
struct can_resolve<Root, std::void_t<decltype(st::resolve_styles(
                             std::declval<Root>(), std::declval<const st::css::Stylesheet&>()))>>
    : std::true_type {};

template <typename Root, typename = void>
struct can_style : std::false_type {};

template <typename Root>
struct can_style<Root, std::void_t<decltype(st::css::style_tree(
                           std::declval<Root>(), std::declval<const st::css::Stylesheet&>()))>>
    : std::true_type {};

}  // namespace

// The styled tree points into its document, so a temporary document is refused.
TEST(StyletreeTest, ResolveRequiresALongLivedDocument) {
    static_assert(can_resolve<const st::html::Node&>::value);
    static_assert(can_resolve<st::html::Node&>::value);
    static_assert(!can_resolve<st::html::Node>::value);
    static_assert(!can_resolve<const st::html::Node>::value);
    static_assert(can_style<const st::html::Node&>::value);
    static_assert(!can_style<st::html::Node>::value);

    const auto root = st::parse_markup("<div><p>hello</p></div>");
    const auto sheet = st::parse_stylesheet("p{color:red;}");
    const auto styled = st::resolve_styles(root, sheet);
    EXPECT_EQ(styled.node, &root);
    EXPECT_EQ(styled.children[0].node, &root.children[0]);
}
