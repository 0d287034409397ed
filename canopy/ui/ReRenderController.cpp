#include "canopy/ui/ReRenderController.hpp"

#include <iostream>

#include "canopy/ui/RenderSurface.hpp"
#include "canopy/ui/WidgetNode.hpp"

namespace canopy::ui
{
void ReRenderController::InitTree(WidgetNode& node)
{
    node.Init2D();
    if (node.parts)
    {
        InitTree(*node.parts);
    }
    for (const auto& child : node.children)
    {
        InitTree(*child);
    }
}

void ReRenderController::StyleTree(WidgetNode& node)
{
    node.Style2D();
    if (node.parts)
    {
        StyleTree(*node.parts);
    }
    for (const auto& child : node.children)
    {
        StyleTree(*child);
    }
}

void ReRenderController::SizeTree(WidgetNode& node)
{
    if (node.parts)
    {
        SizeTree(*node.parts);
    }
    for (const auto& child : node.children)
    {
        SizeTree(*child);
    }
    node.Size2D();
}

void ReRenderController::LayoutTree(WidgetNode& node)
{
    node.Layout2D(ParentBBox(node));
}

void ReRenderController::RenderTree(WidgetNode& node)
{
    node.Render2D();
}

void ReRenderController::MoveTree(WidgetNode& node)
{
    const glm::vec2 delta = node.layData.allocPos - node.layData.allocPosOrig;
    node.Move2D(delta, ParentBBox(node));
}

void ReRenderController::ReRenderTree(WidgetNode& node)
{
    node.ForEach([](WidgetNode& n) { n.needsFullReRender = false; });
    const LayoutData saved = node.layData;
    InitTree(node);
    StyleTree(node);
    SizeTree(node);
    node.layData = saved;
    LayoutTree(node);
    RenderTree(node);
    ++m_reRenderCount;
}

bool ReRenderController::FullReRenderIfNeeded(WidgetNode& node)
{
    // Scrolled-out nodes are never painted; overlays clip to the surface.
    if (!node.needsFullReRender || (node.vpBBox.Empty() && !node.overlay))
    {
        return false;
    }
    if (m_trace.render)
    {
        std::cout << "[Render] NeedsFullReRender for " << node.Path() << "\n";
    }
    ReRenderTree(node);
    return true;
}

void ReRenderController::MarkNeedsFullReRender(WidgetNode& node)
{
    node.MarkNeedsFullReRender();
}

BBox ReRenderController::ParentBBox(const WidgetNode& node) const
{
    if (node.overlay || node.parent == nullptr)
    {
        return node.surface != nullptr ? node.surface->Bounds() : BBox{};
    }
    return node.parent->ContentBBox();
}
} // namespace canopy::ui
