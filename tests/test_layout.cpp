#include <catch2/catch.hpp>

#include <vector>

#include "canopy/core/Config.hpp"
#include "canopy/ui/RecordingSurface.hpp"
#include "canopy/ui/WidgetTree.hpp"
#include "canopy/ui/Widgets.hpp"

using namespace canopy;
using namespace canopy::ui;

namespace
{
struct LayoutFixture
{
    core::ToolkitConfig config;
    RecordingSurface surface{glm::ivec2{200, 100}};
    WidgetTree tree{config};

    LayoutFixture()
    {
        tree.SetSurface(&surface);
    }
};

std::unique_ptr<WidgetNode> StretchSpace(const std::string& name, float width)
{
    auto space = NewSpace(name);
    space->SetMinPrefWidth(UnitValue::Px(width));
    space->SetStretchMaxWidth();
    return space;
}
} // namespace

TEST_CASE("Stretch children fill the content box", "[Layout]")
{
    LayoutFixture fx;

    SECTION("Across a vertical frame")
    {
        WidgetNode* root = fx.tree.SetRoot(NewFrame("root", LayoutDir::Vert));
        WidgetNode* child = root->AddChild(StretchSpace("fill", 50.0F));
        fx.tree.FullRender();

        // Frame: 1px border + 2px padding on each side.
        REQUIRE(root->style.BoxSpace() == Approx(3.0F));
        REQUIRE(root->layData.allocSize.x == Approx(200.0F));
        REQUIRE(child->layData.allocSize.x == Approx(200.0F - 2.0F * 3.0F));
        REQUIRE(child->layData.allocPos.x == Approx(3.0F));
        REQUIRE(child->layData.StretchWidth());
    }

    SECTION("Along a horizontal frame, next to a fixed child")
    {
        WidgetNode* root = fx.tree.SetRoot(NewFrame("root", LayoutDir::Horiz));
        WidgetNode* fill = root->AddChild(StretchSpace("fill", 50.0F));
        auto fixed = NewSpace("fixed");
        fixed->SetFixedWidth(UnitValue::Px(30.0F));
        WidgetNode* fixedNode = root->AddChild(std::move(fixed));
        fx.tree.FullRender();

        REQUIRE(fill->layData.allocSize.x == Approx(194.0F - 30.0F));
        REQUIRE(fixedNode->layData.allocSize.x == Approx(30.0F));
        REQUIRE(fixedNode->layData.allocPos.x == Approx(3.0F + 164.0F));
    }

    SECTION("Without stretch the preferred size is kept")
    {
        WidgetNode* root = fx.tree.SetRoot(NewFrame("root", LayoutDir::Vert));
        auto space = NewSpace("plain");
        space->SetMinPrefWidth(UnitValue::Px(50.0F));
        WidgetNode* child = root->AddChild(std::move(space));
        fx.tree.FullRender();
        REQUIRE(child->layData.allocSize.x == Approx(50.0F));
    }
}

TEST_CASE("Box layout", "[Layout]")
{
    LayoutFixture fx;

    SECTION("Vertical layout stacks children by preferred height")
    {
        WidgetNode* root = fx.tree.SetRoot(NewLayout("root", LayoutDir::Vert));
        WidgetNode* a = root->AddChild(NewLabel("a", "Hi"));
        WidgetNode* b = root->AddChild(NewLabel("b", "There"));
        fx.tree.FullRender();

        // 12pt text is 16 dots; the estimate is 1.4 lines high, plus 2px padding.
        REQUIRE(a->layData.size.pref.y == Approx(16.0F * 1.4F + 4.0F));
        REQUIRE(a->layData.allocPos.y == Approx(0.0F));
        REQUIRE(b->layData.allocPos.y == Approx(a->layData.allocSize.y));
        REQUIRE(b->layData.allocSize.x == Approx(b->layData.size.pref.x));
        REQUIRE(root->layData.size.pref.y == Approx(2.0F * a->layData.size.pref.y));
    }

    SECTION("Layout is deterministic across full renders")
    {
        WidgetNode* root = fx.tree.SetRoot(NewFrame("root", LayoutDir::Horiz));
        root->AddChild(NewButton("ok", "OK", "check"));
        root->AddChild(NewLabel("text", "Some text"));
        root->AddChild(StretchSpace("fill", 10.0F));

        fx.tree.FullRender();
        std::vector<LayoutData> first;
        root->ForEach([&first](WidgetNode& n) { first.push_back(n.layData); });

        fx.tree.FullRender();
        std::vector<LayoutData> second;
        root->ForEach([&second](WidgetNode& n) { second.push_back(n.layData); });

        REQUIRE(first.size() == second.size());
        for (std::size_t i = 0; i < first.size(); ++i)
        {
            REQUIRE(first[i].allocPos == second[i].allocPos);
            REQUIRE(first[i].allocSize == second[i].allocSize);
            REQUIRE(first[i].size.pref == second[i].size.pref);
        }
    }

    SECTION("Cross-axis alignment")
    {
        WidgetNode* root = fx.tree.SetRoot(NewLayout("root", LayoutDir::Vert));
        auto space = NewSpace("centered");
        space->SetFixedWidth(UnitValue::Px(40.0F));
        space->SetProp("horizontal-align", std::string("center"));
        WidgetNode* child = root->AddChild(std::move(space));
        fx.tree.FullRender();
        REQUIRE(child->layData.allocPos.x == Approx(80.0F));
    }

    SECTION("Hidden children take no space and have no box")
    {
        WidgetNode* root = fx.tree.SetRoot(NewLayout("root", LayoutDir::Vert));
        WidgetNode* hidden = root->AddChild(NewLabel("hidden", "Hidden"));
        WidgetNode* shown = root->AddChild(NewLabel("shown", "Shown"));
        hidden->SetVisible(false);
        fx.tree.FullRender();

        REQUIRE_FALSE(hidden->IsVisible());
        REQUIRE(hidden->layData.allocSize == glm::vec2{0.0F, 0.0F});
        REQUIRE(hidden->bbox.Empty());
        REQUIRE(shown->layData.allocPos.y == Approx(0.0F));
    }

    SECTION("Stacked layout gives the whole box to the top child")
    {
        WidgetNode* root = fx.tree.SetRoot(NewLayout("root", LayoutDir::Stacked));
        WidgetNode* first = root->AddChild(NewLabel("first", "One"));
        WidgetNode* second = root->AddChild(NewLabel("second", "Two"));
        SetStackTop(*root, 1);
        fx.tree.FullRender();

        REQUIRE(first->bbox.Empty());
        REQUIRE(second->layData.allocSize == glm::vec2{200.0F, 100.0F});
        REQUIRE(fx.surface.HasText("Two"));
        REQUIRE_FALSE(fx.surface.HasText("One"));
    }

    SECTION("Untyped containers place children at their style position")
    {
        WidgetNode* root = fx.tree.SetRoot(std::make_unique<WidgetNode>("free", nullptr));
        auto child = NewSpace("placed");
        child->SetProp("x", std::string("10px"));
        child->SetProp("y", std::string("20px"));
        WidgetNode* placed = root->AddChild(std::move(child));
        fx.tree.FullRender();

        REQUIRE(root->TypeName() == "Widget");
        REQUIRE(placed->layData.allocPos == glm::vec2{10.0F, 20.0F});
        REQUIRE(placed->layData.allocSize == placed->layData.size.pref);
    }
}

TEST_CASE("Bounding boxes", "[Layout]")
{
    LayoutFixture fx;

    SECTION("Children past the parent's viewport have empty clipped boxes")
    {
        WidgetNode* root = fx.tree.SetRoot(NewLayout("root", LayoutDir::Vert));
        std::vector<WidgetNode*> labels;
        for (int i = 0; i < 5; ++i)
        {
            labels.push_back(root->AddChild(NewLabel("l" + std::to_string(i), "Row " + std::to_string(i))));
        }
        fx.tree.FullRender();

        // Rows are 26.4 high: the fourth is cut by the 100px surface, the fifth is outside.
        REQUIRE_FALSE(labels[3]->vpBBox.Empty());
        REQUIRE(labels[3]->vpBBox.max.y == 100);
        REQUIRE(labels[3]->bbox.max.y > 100);
        REQUIRE_FALSE(labels[4]->bbox.Empty());
        REQUIRE(labels[4]->vpBBox.Empty());
        REQUIRE(labels[4]->winBBox.Empty());
        REQUIRE(fx.surface.HasText("Row 3"));
        REQUIRE_FALSE(fx.surface.HasText("Row 4"));
    }

    SECTION("Window boxes are offset by the surface origin")
    {
        fx.tree.SetSurface(&fx.surface, glm::ivec2{100, 50});
        WidgetNode* root = fx.tree.SetRoot(NewLayout("root", LayoutDir::Vert));
        WidgetNode* label = root->AddChild(NewLabel("label", "Offset"));
        fx.tree.FullRender();

        REQUIRE(label->winBBox.min == label->vpBBox.min + glm::ivec2{100, 50});
        REQUIRE(label->winBBox.max == label->vpBBox.max + glm::ivec2{100, 50});
    }

    SECTION("Content box excludes margin, border and padding")
    {
        WidgetNode* root = fx.tree.SetRoot(NewFrame("root", LayoutDir::Vert));
        fx.tree.FullRender();
        const BBox content = root->ContentBBox();
        REQUIRE(content.min == glm::ivec2{3, 3});
        REQUIRE(content.max == glm::ivec2{197, 97});
    }
}
