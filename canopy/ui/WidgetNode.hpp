#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "canopy/ui/BBox.hpp"
#include "canopy/ui/LayoutBox.hpp"
#include "canopy/ui/Lifecycle.hpp"
#include "canopy/ui/Signals.hpp"
#include "canopy/ui/Style.hpp"
#include "canopy/ui/StyleProps.hpp"

namespace canopy::ui
{
class RenderSurface;
class StyleSheet;
class WidgetTree;

enum class LayoutDir : std::uint8_t
{
    Horiz = 0,
    Vert,
    Stacked
};

struct LayoutContent
{
    LayoutDir dir = LayoutDir::Vert;
    // Index of the visible child for stacked layouts.
    int stackTop = 0;
};

struct LabelContent
{
    std::string text;
};

struct IconContent
{
    std::string icon;
};

struct SpaceContent
{
};

struct ButtonContent
{
    std::string text;
    std::string icon;
};

using WidgetContent = std::variant<std::monostate, LayoutContent, LabelContent, IconContent, SpaceContent, ButtonContent>;

struct MenuItem
{
    std::string label;
    std::function<void()> action;
};

using ContextMenuFunc = std::function<void(WidgetNode&, std::vector<MenuItem>&)>;

// Retained tree node. One struct for every widget kind: behaviour varies
// through the WidgetType table and the content payload.
class WidgetNode : public Initializable, public Styleable, public Sizeable, public Layoutable, public Renderable, public Movable
{
public:
    // Identification
    std::string name;
    const WidgetType* type = nullptr;
    WidgetContent content;
    std::string tooltip;

    // Tree structure
    WidgetNode* parent = nullptr;
    std::vector<std::unique_ptr<WidgetNode>> children;
    // Internal chrome (icon, label...). Its root's parent is the owner.
    std::unique_ptr<WidgetNode> parts;
    bool isPart = false;

    // Style inputs
    Props props;
    std::vector<std::string> classes;
    std::shared_ptr<StyleSheet> css;
    // Default handed down by the owning widget when this node is a part.
    std::shared_ptr<const Style> defStyle;

    // Resolved state
    Style style;
    LayoutData layData;
    // Unclipped box, box clipped to the parent viewport, and the clipped box
    // in window coordinates.
    BBox bbox;
    BBox vpBBox;
    BBox winBBox;

    // Dirty and interaction flags
    NodeState state = NodeState::Uninitialized;
    bool needsFullReRender = false;
    bool selected = false;
    bool inactive = false;
    bool overlay = false;
    bool hovered = false;
    bool pressed = false;
    bool focused = false;

    // Bindings made by Init
    WidgetTree* tree = nullptr;
    RenderSurface* surface = nullptr;

    WidgetSignals signals;
    ContextMenuFunc contextMenu;

    WidgetNode() = default;
    WidgetNode(std::string nodeName, const WidgetType* nodeType) : name(std::move(nodeName)), type(nodeType) {}
    ~WidgetNode() override;

    WidgetNode(const WidgetNode&) = delete;
    WidgetNode& operator=(const WidgetNode&) = delete;

    // Lifecycle capabilities
    void Init2D() override;
    void Style2D() override;
    void Size2D() override;
    void Layout2D(const BBox& parentBBox) override;
    void Render2D() override;
    void Move2D(const glm::vec2& delta, const BBox& parentBBox) override;
    void AllocChildren();
    void PaintSelf();
    void ConnectEvents();

    // Tree manipulation. Every structural or property change marks the node
    // for a full re-render before its next paint.
    WidgetNode* AddChild(std::unique_ptr<WidgetNode> child);
    std::unique_ptr<WidgetNode> RemoveChild(WidgetNode* child);
    void DeleteChildren();
    WidgetNode* SetParts(std::unique_ptr<WidgetNode> partsRoot);

    [[nodiscard]] WidgetNode* FindChild(std::string_view childName) const;
    [[nodiscard]] WidgetNode* FindDescendant(std::string_view descendantName) const;
    [[nodiscard]] WidgetNode* FindPart(std::string_view partName) const;

    void SetProp(const std::string& key, PropValue value);
    void DeleteProp(const std::string& key);
    void AddClass(const std::string& className);
    [[nodiscard]] bool HasClass(const std::string& className) const;
    void SetVisible(bool visible);
    void SetInactive(bool value);
    void SetSelected(bool value);

    // Size helpers
    void SetMinPrefWidth(const UnitValue& width);
    void SetMinPrefHeight(const UnitValue& height);
    void SetStretchMaxWidth();
    void SetStretchMaxHeight();
    void SetFixedWidth(const UnitValue& width);
    void SetFixedHeight(const UnitValue& height);

    [[nodiscard]] std::string_view TypeName() const;
    // Selector of the current interaction state (":inactive", ":active",
    // ":selected", ":hover"), or empty.
    [[nodiscard]] std::string_view StateSelector() const;
    // Parent path joined by '/', parts marked with '#'.
    [[nodiscard]] std::string Path() const;
    // Content area of this node: the viewport box inset by BoxSpace.
    [[nodiscard]] BBox ContentBBox() const;
    [[nodiscard]] bool IsVisible() const;

    // Visits this node, its parts and its children in paint order.
    void ForEach(const std::function<void(WidgetNode&)>& visit);

    void MarkNeedsFullReRender() { needsFullReRender = true; }
};
} // namespace canopy::ui
