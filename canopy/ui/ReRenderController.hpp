#pragma once

#include "canopy/core/Config.hpp"
#include "canopy/ui/BBox.hpp"

namespace canopy::ui
{
class WidgetNode;

// Drives the lifecycle passes over a subtree, and the targeted full re-pass
// for nodes flagged as needing it.
class ReRenderController
{
public:
    explicit ReRenderController(const core::TraceConfig& trace) : m_trace(trace) {}

    // Top-down: node, parts, children.
    void InitTree(WidgetNode& node);
    void StyleTree(WidgetNode& node);
    // Bottom-up: parts and children first, then the node.
    void SizeTree(WidgetNode& node);
    // Lays the node out inside its parent's content box (or the whole
    // surface for roots and overlays); recursion happens in Layout2D.
    void LayoutTree(WidgetNode& node);
    void RenderTree(WidgetNode& node);
    // Moves the node by allocPos - allocPosOrig.
    void MoveTree(WidgetNode& node);

    // Init, Style and Size the subtree, then restore the node's previous
    // layout data as the baseline and Layout and Render it again. Siblings
    // are not touched.
    void ReRenderTree(WidgetNode& node);

    // Runs ReRenderTree when the node is flagged and has a non-empty box.
    // Returns true when it did; the caller must not render the node again.
    bool FullReRenderIfNeeded(WidgetNode& node);

    // Flags the node; its next Render2D re-runs the passes on its subtree.
    static void MarkNeedsFullReRender(WidgetNode& node);

    [[nodiscard]] BBox ParentBBox(const WidgetNode& node) const;
    [[nodiscard]] int ReRenderCount() const { return m_reRenderCount; }

private:
    const core::TraceConfig& m_trace;
    int m_reRenderCount = 0;
};
} // namespace canopy::ui
