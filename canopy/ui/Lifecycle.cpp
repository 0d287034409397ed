#include "canopy/ui/Lifecycle.hpp"

#include <iostream>
#include <vector>

#include <glm/common.hpp>

#include "canopy/ui/RenderSurface.hpp"
#include "canopy/ui/StyleSheet.hpp"
#include "canopy/ui/WidgetNode.hpp"
#include "canopy/ui/WidgetTree.hpp"
#include "canopy/ui/Widgets.hpp"

namespace canopy::ui
{
namespace
{
std::ostream& operator<<(std::ostream& out, const BBox& box)
{
    return out << "(" << box.min.x << "," << box.min.y << ")-(" << box.max.x << "," << box.max.y << ")";
}

glm::vec2 ViewportSize(const WidgetNode& node)
{
    return node.surface != nullptr ? glm::vec2(node.surface->Size()) : glm::vec2{0.0F, 0.0F};
}

// Sizes relative units resolve against: the parent's allocation, or the
// viewport for roots and overlays.
glm::vec2 ElementSize(const WidgetNode& node)
{
    return node.parent != nullptr ? node.parent->layData.allocSize : ViewportSize(node);
}

// Global sheet first, then sheets attached along the ancestor chain from the
// root down, so closer sheets win on equal specificity.
std::vector<const StyleSheet*> CollectSheets(const WidgetNode& node)
{
    std::vector<const StyleSheet*> sheets;
    for (const WidgetNode* n = &node; n != nullptr; n = n->parent)
    {
        if (n->css)
        {
            sheets.insert(sheets.begin(), n->css.get());
        }
    }
    if (node.tree != nullptr && node.tree->Sheet() != nullptr)
    {
        sheets.insert(sheets.begin(), node.tree->Sheet());
    }
    return sheets;
}

void SetBBoxes(WidgetNode& node, const BBox& parentBBox)
{
    node.bbox = node.IsVisible() ? BBoxFromLayout(node.layData) : BBox{};
    node.vpBBox = node.bbox.Intersect(parentBBox);
    const glm::ivec2 origin = node.tree != nullptr ? node.tree->WindowOrigin() : glm::ivec2{0, 0};
    node.winBBox = node.vpBBox.Empty() ? BBox{} : node.vpBBox.Translated(origin);
}
} // namespace

void DefaultInit2D(WidgetNode& node)
{
    for (WidgetNode* p = node.parent; p != nullptr; p = p->parent)
    {
        if (p->tree != nullptr)
        {
            node.tree = p->tree;
            node.surface = p->surface;
            break;
        }
    }
    if (node.tree != nullptr && node.surface == nullptr)
    {
        node.surface = node.tree->Surface();
    }
    node.state = NodeState::Initialized;
}

void DefaultStyle2D(WidgetNode& node)
{
    if (node.surface == nullptr)
    {
        node.Init2D();
    }
    if (node.tree == nullptr)
    {
        std::cerr << "[Style] " << node.Path() << ": not attached to a widget tree\n";
        return;
    }
    WidgetTree& tree = *node.tree;

    const std::vector<const StyleSheet*> sheets = CollectSheets(node);
    StyleRequest request;
    request.typeName = node.TypeName();
    request.selector = node.StateSelector();
    request.name = node.name;
    request.parent = node.parent != nullptr ? &node.parent->style : nullptr;
    request.defStyle = node.defStyle.get();
    request.instanceProps = &node.props;
    request.classes = &node.classes;
    request.sheets = &sheets;

    node.style = tree.Resolver().Resolve(request);
    if (node.inactive)
    {
        node.style.inactive = true;
    }
    node.style.SetUnitContext(tree.BaseUnits(), ViewportSize(node), ElementSize(node));
    node.layData.SetFromStyle(node.style.layout);
    node.state = NodeState::Styled;

    if (tree.Config().trace.style)
    {
        std::cout << "[Style] " << node.Path() << " font " << node.style.font.size.dots << " pad " << node.style.padding.dots << "\n";
    }
}

void DefaultSize2D(WidgetNode& node)
{
    if (node.parts)
    {
        const float spc = 2.0F * node.style.BoxSpace();
        const SizePrefs& partsSize = node.parts->layData.size;
        node.layData.size.need = glm::max(node.layData.size.need, partsSize.need + spc);
        node.layData.size.pref = glm::max(node.layData.size.pref, partsSize.pref + spc);
    }
    node.layData.UpdateSizes();
    node.state = NodeState::Sized;
}

void DefaultLayout2D(WidgetNode& node, const BBox& parentBBox)
{
    if (node.surface == nullptr || !node.style.resolved)
    {
        node.Init2D();
        node.Style2D();
    }
    if (node.surface == nullptr)
    {
        std::cerr << "[Layout] " << node.Path() << ": no render surface\n";
        return;
    }

    LayoutData& ld = node.layData;
    const glm::vec2 parentPos = node.parent != nullptr ? node.parent->layData.allocPos : glm::vec2{0.0F, 0.0F};
    ld.allocPos = parentPos + ld.allocPosRel;
    ld.allocPosOrig = ld.allocPos;

    node.style.SetUnitContext(node.tree->BaseUnits(), ViewportSize(node), ElementSize(node));
    node.AllocChildren();
    SetBBoxes(node, parentBBox);
    node.state = NodeState::LaidOut;

    if (node.tree->Config().trace.layout)
    {
        std::cout << "[Layout] " << node.Path() << " alloc pos " << ld.allocPos.x << "," << ld.allocPos.y << " size "
                  << ld.allocSize.x << "," << ld.allocSize.y << " vpbb " << node.vpBBox << " winbb " << node.winBBox << "\n";
    }

    if (node.parts)
    {
        const float spc = node.style.BoxSpace();
        node.parts->layData.allocPosRel = glm::vec2{spc, spc};
        node.parts->layData.allocSize = glm::max(ld.allocSize - 2.0F * spc, glm::vec2{0.0F, 0.0F});
        node.parts->Layout2D(node.ContentBBox());
    }
    const BBox content = node.ContentBBox();
    for (const auto& child : node.children)
    {
        child->Layout2D(content);
    }
}

void DefaultMove2D(WidgetNode& node, const glm::vec2& delta, const BBox& parentBBox)
{
    node.layData.allocPos = node.layData.allocPosOrig + delta;
    SetBBoxes(node, parentBBox);

    if (node.tree != nullptr && node.tree->Config().trace.move)
    {
        std::cout << "[Layout] Move " << node.Path() << " delta " << delta.x << "," << delta.y << " vpbb " << node.vpBBox << "\n";
    }

    const BBox content = node.ContentBBox();
    if (node.parts)
    {
        node.parts->Move2D(delta, content);
    }
    for (const auto& child : node.children)
    {
        child->Move2D(delta, content);
    }
}

bool PushBounds(WidgetNode& node)
{
    if (node.surface == nullptr)
    {
        return false;
    }
    if (node.overlay)
    {
        node.surface->PushBounds(node.surface->Bounds());
        return true;
    }
    if (node.vpBBox.Empty())
    {
        node.needsFullReRender = false;
        return false;
    }
    node.surface->PushBounds(node.vpBBox);
    return true;
}

void PopBounds(WidgetNode& node)
{
    if (node.surface != nullptr)
    {
        node.surface->PopBounds();
    }
}

void DefaultRender2D(WidgetNode& node)
{
    if (node.tree == nullptr)
    {
        std::cerr << "[Render] " << node.Path() << ": not attached to a widget tree\n";
        return;
    }
    WidgetTree& tree = *node.tree;
    if (tree.ReRender().FullReRenderIfNeeded(node))
    {
        return;
    }
    if (!PushBounds(node))
    {
        tree.Events().DisconnectAll(node, true);
        return;
    }

    if (tree.Config().trace.render)
    {
        std::cout << "[Render] " << node.Path() << " at " << node.vpBBox << "\n";
    }

    node.ConnectEvents();
    if (node.type != nullptr && node.type->paint != nullptr)
    {
        node.PaintSelf();
    }
    else
    {
        RenderStdBox(node);
    }
    if (node.parts)
    {
        node.parts->Render2D();
    }
    for (const auto& child : node.children)
    {
        child->Render2D();
    }
    PopBounds(node);
    node.state = NodeState::Rendered;
}
} // namespace canopy::ui
