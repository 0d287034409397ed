#pragma once

#include <cstdint>
#include <string_view>

#include <glm/vec2.hpp>

#include "canopy/ui/BBox.hpp"

namespace canopy::ui
{
class WidgetNode;

enum class NodeState : std::uint8_t
{
    Uninitialized = 0,
    Initialized,
    Styled,
    Sized,
    LaidOut,
    Rendered
};

// Binds the node to the nearest ancestor's tree and render surface.
class Initializable
{
public:
    virtual ~Initializable() = default;
    virtual void Init2D() = 0;
};

// Resolves the style snapshot.
class Styleable
{
public:
    virtual ~Styleable() = default;
    virtual void Style2D() = 0;
};

// Computes preferred size. Runs after children and parts were sized.
class Sizeable
{
public:
    virtual ~Sizeable() = default;
    virtual void Size2D() = 0;
};

// Assigns final position and bounding boxes, then lays out children.
class Layoutable
{
public:
    virtual ~Layoutable() = default;
    virtual void Layout2D(const BBox& parentBBox) = 0;
};

class Renderable
{
public:
    virtual ~Renderable() = default;
    virtual void Render2D() = 0;
};

// Translates a laid-out subtree without resizing it.
class Movable
{
public:
    virtual ~Movable() = default;
    virtual void Move2D(const glm::vec2& delta, const BBox& parentBBox) = 0;
};

// Per-type dispatch table. A null entry means the shared default step is
// used; a custom entry may call the default itself before or after its own
// work.
struct WidgetType
{
    std::string_view name;
    void (*init)(WidgetNode& node) = nullptr;
    void (*style)(WidgetNode& node) = nullptr;
    void (*size)(WidgetNode& node) = nullptr;
    void (*layout)(WidgetNode& node, const BBox& parentBBox) = nullptr;
    void (*render)(WidgetNode& node) = nullptr;
    void (*move)(WidgetNode& node, const glm::vec2& delta, const BBox& parentBBox) = nullptr;
    // Sets allocPosRel and allocSize of the children from this node's
    // allocation. Null keeps children at their style position and size.
    void (*allocChildren)(WidgetNode& node) = nullptr;
    // Draws the node's own box. Null draws the standard box.
    void (*paint)(WidgetNode& node) = nullptr;
    void (*connectEvents)(WidgetNode& node) = nullptr;
};

// Shared default steps, usable from custom table entries.
void DefaultInit2D(WidgetNode& node);
void DefaultStyle2D(WidgetNode& node);
void DefaultSize2D(WidgetNode& node);
void DefaultLayout2D(WidgetNode& node, const BBox& parentBBox);
void DefaultRender2D(WidgetNode& node);
void DefaultMove2D(WidgetNode& node, const glm::vec2& delta, const BBox& parentBBox);

// Pushes the clip region for the node. Overlays clip to the whole surface;
// other nodes with an empty viewport box push nothing and return false.
bool PushBounds(WidgetNode& node);
void PopBounds(WidgetNode& node);
} // namespace canopy::ui
