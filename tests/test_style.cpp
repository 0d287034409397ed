#include <catch2/catch.hpp>

#include <vector>

#include "canopy/core/Config.hpp"
#include "canopy/ui/Color.hpp"
#include "canopy/ui/StyleContext.hpp"
#include "canopy/ui/StyleProps.hpp"
#include "canopy/ui/StyleResolver.hpp"
#include "canopy/ui/StyleSheet.hpp"
#include "canopy/ui/Widgets.hpp"

using namespace canopy;
using namespace canopy::ui;

namespace
{
const glm::vec4 kRed{1.0F, 0.0F, 0.0F, 1.0F};
const glm::vec4 kGreen{0.0F, 1.0F, 0.0F, 1.0F};
const glm::vec4 kBlue{0.0F, 0.0F, 1.0F, 1.0F};

struct StyleFixture
{
    core::ToolkitConfig config;
    StyleContext context{config};
    StyleResolver resolver{context};

    StyleFixture()
    {
        RegisterBuiltinTypes(context.Types());
        context.Types().Register("Tag", Props{{"color", std::string("#00ff00")}, {"padding", std::string("3px")}});
        context.Types().RegisterSelector("Tag", ".loud", Props{{"font-weight", std::string("bold")}});
    }
};
} // namespace

TEST_CASE("Type default styles are cached", "[Style]")
{
    StyleFixture fx;

    SECTION("Repeated lookups share one computed style")
    {
        auto first = fx.resolver.DefaultStyle("Tag");
        auto second = fx.resolver.DefaultStyle("Tag");
        REQUIRE(first == second);
        REQUIRE(fx.context.ComputeCount() == 1);
        REQUIRE(first->resolved);
        REQUIRE(first->color == kGreen);
        REQUIRE(first->padding.value == Approx(3.0F));
    }

    SECTION("Rebuild flag recomputes into the same object")
    {
        auto first = fx.resolver.DefaultStyle("Tag");
        fx.config.rebuildDefaultStyles = true;
        fx.context.Types().Register("Tag", Props{{"color", std::string("#0000ff")}});
        auto second = fx.resolver.DefaultStyle("Tag");
        REQUIRE(fx.context.ComputeCount() == 2);
        REQUIRE(first == second);
        REQUIRE(first->color == kBlue);
    }

    SECTION("Without the rebuild flag registry edits need ClearCache")
    {
        auto before = fx.resolver.DefaultStyle("Tag");
        fx.context.Types().Register("Tag", Props{{"color", std::string("#0000ff")}});
        REQUIRE(fx.resolver.DefaultStyle("Tag")->color == kGreen);
        fx.resolver.ClearCache();
        REQUIRE(fx.resolver.DefaultStyle("Tag")->color == kBlue);
        REQUIRE(before->color == kGreen);
    }

    SECTION("Unknown types get the universal defaults")
    {
        auto style = fx.resolver.DefaultStyle("NoSuchType");
        REQUIRE(style->resolved);
        REQUIRE(style->padding.value == Approx(0.0F));
        REQUIRE(style->opacity == Approx(1.0F));
    }
}

TEST_CASE("Selector sub-maps", "[Style]")
{
    StyleFixture fx;

    SECTION("State selector layers over the unselected default")
    {
        auto plain = fx.resolver.DefaultStyle("Button");
        auto hover = fx.resolver.DefaultStyle("Button", ":hover");
        REQUIRE(hover != plain);
        REQUIRE(hover->background == *ParseColor("#ececec"));
        REQUIRE(hover->border.radius.value == Approx(plain->border.radius.value));
    }

    SECTION("Missing sub-map yields the unselected default")
    {
        auto plain = fx.resolver.DefaultStyle("Button");
        auto focus = fx.resolver.DefaultStyle("Button", ":focus");
        REQUIRE(focus->background == plain->background);
        REQUIRE(focus->padding.value == Approx(plain->padding.value));
    }

    SECTION("Part defaults come from the owner's #part map")
    {
        auto iconDefault = fx.resolver.DefaultStyle("Icon");
        auto buttonIcon = fx.resolver.StylePart("Button", "Icon", "Icon");
        REQUIRE(buttonIcon != iconDefault);
        REQUIRE(buttonIcon->fill == *ParseColor("#3060c0"));
        REQUIRE(buttonIcon->layout.width.unit == Unit::Em);
    }

    SECTION("Owner without a #part map hands out the part type default")
    {
        auto iconDefault = fx.resolver.DefaultStyle("Icon");
        REQUIRE(fx.resolver.StylePart("Frame", "icon", "Icon") == iconDefault);
    }
}

TEST_CASE("Resolve applies inheritance and instance properties", "[Style]")
{
    StyleFixture fx;
    Style parent;
    parent.Defaults();
    parent.color = kRed;
    parent.background = kBlue;
    parent.font.size = UnitValue::Pt(20.0F);

    SECTION("Inherited fields come from the parent, others do not")
    {
        Style root = fx.resolver.Resolve(StyleRequest{.typeName = "Label"});
        StyleRequest request{.typeName = "Label", .parent = &parent};
        Style child = fx.resolver.Resolve(request);
        REQUIRE(child.color == kRed);
        REQUIRE(child.font.size.value == Approx(20.0F));
        REQUIRE(child.background == root.background);
    }

    SECTION("inherit copies a non-inherited field from the parent")
    {
        Props props{{"background-color", std::string("inherit")}};
        Style child = fx.resolver.Resolve(StyleRequest{.typeName = "Label", .parent = &parent, .instanceProps = &props});
        REQUIRE(child.background == kBlue);
    }

    SECTION("initial restores the type default over an inherited value")
    {
        Props props{{"color", std::string("initial")}};
        Style child = fx.resolver.Resolve(StyleRequest{.typeName = "Tag", .parent = &parent, .instanceProps = &props});
        REQUIRE(child.color == kGreen);
    }

    SECTION("inherit without a parent leaves the field alone")
    {
        Props props{{"color", std::string("inherit")}};
        Style style = fx.resolver.Resolve(StyleRequest{.typeName = "Tag", .instanceProps = &props});
        REQUIRE(style.color == kGreen);
    }

    SECTION("Unparseable values are skipped")
    {
        Props props{{"padding", std::string("wide")}, {"margin", std::string("5px")}, {"bogus-key", std::string("1")}};
        Style style = fx.resolver.Resolve(StyleRequest{.typeName = "Tag", .instanceProps = &props});
        REQUIRE(style.padding.value == Approx(3.0F));
        REQUIRE(style.layout.margin.value == Approx(5.0F));

        Style direct = style;
        Style initial;
        initial.Defaults();
        REQUIRE(ApplyStyleProps(direct, props, nullptr, initial, "test") == 1);
    }

    SECTION("Class sub-maps from type metadata")
    {
        std::vector<std::string> classes{"loud"};
        Style style = fx.resolver.Resolve(StyleRequest{.typeName = "Tag", .classes = &classes});
        REQUIRE(style.font.weight == FontWeight::Bold);
    }

    SECTION("A part default replaces the type default")
    {
        Style def;
        def.Defaults();
        def.fill = kRed;
        Style style = fx.resolver.Resolve(StyleRequest{.typeName = "Icon", .defStyle = &def});
        REQUIRE(style.fill == kRed);
        REQUIRE(style.layout.width.value == Approx(0.0F));
    }
}

TEST_CASE("Style sheets cascade by specificity", "[Style]")
{
    StyleFixture fx;
    StyleSheet sheet;
    std::string error;
    REQUIRE(ParseStyleSheet(R"({
        "name": "test",
        "rules": [
            { "selector": "Tag#special", "properties": { "padding": "9px" } },
            { "selector": "Tag", "properties": { "padding": "4px", "margin": "1px" } },
            { "selector": ".loud", "properties": { "padding": "6px" } },
            { "selector": "Tag:hover", "properties": { "color": "#ff0000" } },
            { "selector": "", "properties": { "padding": "100px" } }
        ]
    })",
        sheet, &error));
    REQUIRE(sheet.rules.size() == 4);
    std::vector<const StyleSheet*> sheets{&sheet};

    SECTION("Type rule applies to plain nodes")
    {
        Style style = fx.resolver.Resolve(StyleRequest{.typeName = "Tag", .sheets = &sheets});
        REQUIRE(style.padding.value == Approx(4.0F));
        REQUIRE(style.layout.margin.value == Approx(1.0F));
        REQUIRE(style.color == kGreen);
    }

    SECTION("Higher specificity wins regardless of order")
    {
        std::vector<std::string> classes{"loud"};
        Style style = fx.resolver.Resolve(StyleRequest{.typeName = "Tag", .name = "special", .classes = &classes, .sheets = &sheets});
        REQUIRE(style.padding.value == Approx(9.0F));
        Style loud = fx.resolver.Resolve(StyleRequest{.typeName = "Tag", .classes = &classes, .sheets = &sheets});
        REQUIRE(loud.padding.value == Approx(6.0F));
    }

    SECTION("State rules match the state selector")
    {
        Style hover = fx.resolver.Resolve(StyleRequest{.typeName = "Tag", .selector = ":hover", .sheets = &sheets});
        REQUIRE(hover.color == kRed);
    }

    SECTION("Malformed sheets are reported")
    {
        StyleSheet bad;
        REQUIRE_FALSE(ParseStyleSheet("{ not json", bad, &error));
        REQUIRE_FALSE(error.empty());
        REQUIRE_FALSE(ParseStyleSheet(R"({"name": "x"})", bad, &error));
        REQUIRE(error == "missing rules array");
    }
}

TEST_CASE("Selector parsing", "[Style]")
{
    const Selector sel = ParseSelector(" Button#ok.primary.wide:hover ");
    REQUIRE(sel.typeName == "Button");
    REQUIRE(sel.name == "ok");
    REQUIRE(sel.classes == std::vector<std::string>{"primary", "wide"});
    REQUIRE(sel.state == "hover");
    REQUIRE(sel.Specificity() == 100 + 20 + 10 + 1);
    REQUIRE(ParseSelector("*").universal);
    REQUIRE(ParseSelector("").IsEmpty());
}
