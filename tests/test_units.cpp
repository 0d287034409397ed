#include <catch2/catch.hpp>

#include "canopy/ui/BBox.hpp"
#include "canopy/ui/Color.hpp"
#include "canopy/ui/LayoutBox.hpp"
#include "canopy/ui/Style.hpp"
#include "canopy/ui/Units.hpp"

using namespace canopy::ui;

TEST_CASE("Unit value parsing", "[Units]")
{
    SECTION("Bare numbers are pixels with dots already set")
    {
        const auto value = ParseUnitValue(" -1 ");
        REQUIRE(value.has_value());
        REQUIRE(value->unit == Unit::Px);
        REQUIRE(value->value == Approx(-1.0F));
        REQUIRE(value->dots == Approx(-1.0F));
    }

    SECTION("Suffixes select the unit, case-insensitively")
    {
        REQUIRE(ParseUnitValue("12px")->unit == Unit::Px);
        REQUIRE(ParseUnitValue("1.5EM")->unit == Unit::Em);
        REQUIRE(ParseUnitValue("1.5em")->value == Approx(1.5F));
        REQUIRE(ParseUnitValue("50%")->unit == Unit::Pct);
        REQUIRE(ParseUnitValue("10 vmin")->unit == Unit::Vmin);
        REQUIRE(ParseUnitValue("2mm")->unit == Unit::Mm);
        REQUIRE(UnitName(Unit::Vmax) == "vmax");
    }

    SECTION("Garbage is rejected")
    {
        REQUIRE_FALSE(ParseUnitValue("").has_value());
        REQUIRE_FALSE(ParseUnitValue("wide").has_value());
        REQUIRE_FALSE(ParseUnitValue("12furlongs").has_value());
    }
}

TEST_CASE("Unit conversion to dots", "[Units]")
{
    UnitContext ctx;
    ctx.dotsPerPx = 2.0F;
    ctx.fontEm = 16.0F;
    ctx.viewport = glm::vec2{800.0F, 600.0F};
    ctx.element = glm::vec2{200.0F, 100.0F};

    REQUIRE(ctx.ToDots(10.0F, Unit::Px) == Approx(20.0F));
    REQUIRE(ctx.ToDots(10.0F, Unit::Dot) == Approx(10.0F));
    REQUIRE(ctx.ToDots(12.0F, Unit::Pt) == Approx(32.0F));
    REQUIRE(ctx.ToDots(1.0F, Unit::In) == Approx(192.0F));
    REQUIRE(ctx.ToDots(1.0F, Unit::Em) == Approx(32.0F));
    REQUIRE(ctx.ToDots(1.0F, Unit::Ex) == Approx(16.0F));

    SECTION("Percent follows the element axis")
    {
        REQUIRE(ctx.ToDots(50.0F, Unit::Pct, UnitAxis::Width) == Approx(100.0F));
        REQUIRE(ctx.ToDots(50.0F, Unit::Pct, UnitAxis::Height) == Approx(50.0F));
    }

    SECTION("Viewport units ignore pixel density")
    {
        REQUIRE(ctx.ToDots(10.0F, Unit::Vw) == Approx(80.0F));
        REQUIRE(ctx.ToDots(10.0F, Unit::Vh) == Approx(60.0F));
        REQUIRE(ctx.ToDots(10.0F, Unit::Vmin) == Approx(60.0F));
        REQUIRE(ctx.ToDots(10.0F, Unit::Vmax) == Approx(80.0F));
    }

    SECTION("Values convert in place")
    {
        UnitValue size = UnitValue::Pt(12.0F);
        REQUIRE(size.dots == Approx(0.0F));
        size.ToDots(ctx);
        REQUIRE(size.dots == Approx(32.0F));
    }

    SECTION("An em font size scales the base em once")
    {
        Style style;
        style.font.size = UnitValue::Em(2.0F);
        style.layout.width = UnitValue::Em(1.0F);
        style.padding = UnitValue::Em(0.5F);
        style.SetUnitContext(ctx, ctx.viewport, ctx.element);
        REQUIRE(style.font.size.dots == Approx(64.0F));
        REQUIRE(style.units.fontEm == Approx(32.0F));
        REQUIRE(style.layout.width.dots == Approx(64.0F));
        REQUIRE(style.padding.dots == Approx(32.0F));

        style.SetUnitContext(ctx, ctx.viewport, ctx.element);
        REQUIRE(style.font.size.dots == Approx(64.0F));
        REQUIRE(style.layout.width.dots == Approx(64.0F));
    }
}

TEST_CASE("Color parsing", "[Units]")
{
    SECTION("Hex forms")
    {
        REQUIRE(*ParseColor("#fff") == glm::vec4{1.0F, 1.0F, 1.0F, 1.0F});
        REQUIRE(*ParseColor("#FF0000") == glm::vec4{1.0F, 0.0F, 0.0F, 1.0F});
        REQUIRE(ParseColor("#00000000")->a == Approx(0.0F));
        REQUIRE(ParseColor("#f008")->a == Approx(136.0F / 255.0F));
        REQUIRE_FALSE(ParseColor("#12345").has_value());
        REQUIRE_FALSE(ParseColor("#ggg").has_value());
    }

    SECTION("rgb and rgba")
    {
        const auto color = ParseColor("rgb(255, 0, 51)");
        REQUIRE(color.has_value());
        REQUIRE(color->b == Approx(0.2F));
        REQUIRE(color->a == Approx(1.0F));
        REQUIRE(ParseColor("rgba(0,0,0,0.5)")->a == Approx(0.5F));
        REQUIRE_FALSE(ParseColor("rgb(1,2)").has_value());
    }

    SECTION("Names")
    {
        REQUIRE(ParseColor("none")->a == Approx(0.0F));
        REQUIRE(ParseColor(" White ")->r == Approx(1.0F));
        REQUIRE(ParseColor("green")->g == Approx(0.5F));
        REQUIRE_FALSE(ParseColor("chartreuse-ish").has_value());
        REQUIRE_FALSE(ParseColor("").has_value());
    }
}

TEST_CASE("Bounding box arithmetic", "[Units]")
{
    const BBox a{glm::ivec2{0, 0}, glm::ivec2{10, 10}};
    const BBox b{glm::ivec2{5, 5}, glm::ivec2{20, 20}};

    REQUIRE(a.Intersect(b) == BBox{glm::ivec2{5, 5}, glm::ivec2{10, 10}});
    REQUIRE(a.Intersect(BBox{glm::ivec2{10, 0}, glm::ivec2{20, 10}}).Empty());
    REQUIRE(a.Translated(glm::ivec2{3, -2}).min == glm::ivec2{3, -2});
    REQUIRE(a.Inset(2).Size() == glm::ivec2{6, 6});
    REQUIRE(a.Inset(6).Empty());
    REQUIRE(a.Contains(glm::vec2{0.0F, 9.5F}));
    REQUIRE_FALSE(a.Contains(glm::vec2{10.0F, 5.0F}));

    SECTION("Layout boxes round outward")
    {
        LayoutData ld;
        ld.allocPos = glm::vec2{1.5F, 2.25F};
        ld.allocSize = glm::vec2{10.0F, 3.5F};
        const BBox box = BBoxFromLayout(ld);
        REQUIRE(box.min == glm::ivec2{1, 2});
        REQUIRE(box.max == glm::ivec2{12, 6});
    }
}
