#include "canopy/ui/WidgetNode.hpp"

#include <algorithm>

#include "canopy/ui/WidgetTree.hpp"

namespace canopy::ui
{
WidgetNode::~WidgetNode()
{
    if (tree != nullptr)
    {
        tree->Events().DisconnectAll(*this, false);
        tree->Events().ReleaseFocus(*this, false);
    }
}

void WidgetNode::Init2D()
{
    if (type != nullptr && type->init != nullptr)
    {
        type->init(*this);
        return;
    }
    DefaultInit2D(*this);
}

void WidgetNode::Style2D()
{
    if (type != nullptr && type->style != nullptr)
    {
        type->style(*this);
        return;
    }
    DefaultStyle2D(*this);
}

void WidgetNode::Size2D()
{
    if (type != nullptr && type->size != nullptr)
    {
        type->size(*this);
        return;
    }
    DefaultSize2D(*this);
}

void WidgetNode::Layout2D(const BBox& parentBBox)
{
    if (type != nullptr && type->layout != nullptr)
    {
        type->layout(*this, parentBBox);
        return;
    }
    DefaultLayout2D(*this, parentBBox);
}

void WidgetNode::Render2D()
{
    if (type != nullptr && type->render != nullptr)
    {
        type->render(*this);
        return;
    }
    DefaultRender2D(*this);
}

void WidgetNode::Move2D(const glm::vec2& delta, const BBox& parentBBox)
{
    if (type != nullptr && type->move != nullptr)
    {
        type->move(*this, delta, parentBBox);
        return;
    }
    DefaultMove2D(*this, delta, parentBBox);
}

void WidgetNode::AllocChildren()
{
    if (type != nullptr && type->allocChildren != nullptr)
    {
        type->allocChildren(*this);
        return;
    }
    // Free placement: style position inside the content box, preferred size.
    const float spc = style.BoxSpace();
    for (const auto& child : children)
    {
        child->layData.allocPosRel = glm::vec2{spc + child->style.layout.posX.dots, spc + child->style.layout.posY.dots};
        child->layData.allocSize = child->layData.size.pref;
    }
}

void WidgetNode::PaintSelf()
{
    if (type != nullptr && type->paint != nullptr)
    {
        type->paint(*this);
    }
}

void WidgetNode::ConnectEvents()
{
    if (type != nullptr && type->connectEvents != nullptr)
    {
        type->connectEvents(*this);
    }
}

WidgetNode* WidgetNode::AddChild(std::unique_ptr<WidgetNode> child)
{
    if (!child)
    {
        return nullptr;
    }
    child->parent = this;
    child->isPart = isPart;
    children.push_back(std::move(child));
    MarkNeedsFullReRender();
    return children.back().get();
}

std::unique_ptr<WidgetNode> WidgetNode::RemoveChild(WidgetNode* child)
{
    for (auto it = children.begin(); it != children.end(); ++it)
    {
        if (it->get() == child)
        {
            auto removed = std::move(*it);
            children.erase(it);
            if (tree != nullptr)
            {
                tree->Events().DisconnectAll(*removed, true);
                tree->Events().ReleaseFocus(*removed, true);
            }
            removed->parent = nullptr;
            // Detached nodes rebind on the Init of whatever tree adopts them.
            removed->ForEach([](WidgetNode& node) {
                node.tree = nullptr;
                node.surface = nullptr;
                node.state = NodeState::Uninitialized;
            });
            MarkNeedsFullReRender();
            return removed;
        }
    }
    return nullptr;
}

void WidgetNode::DeleteChildren()
{
    if (tree != nullptr)
    {
        for (const auto& child : children)
        {
            tree->Events().DisconnectAll(*child, true);
        }
    }
    children.clear();
    MarkNeedsFullReRender();
}

WidgetNode* WidgetNode::SetParts(std::unique_ptr<WidgetNode> partsRoot)
{
    if (parts && tree != nullptr)
    {
        tree->Events().DisconnectAll(*parts, true);
    }
    parts = std::move(partsRoot);
    if (parts)
    {
        parts->parent = this;
        parts->ForEach([](WidgetNode& node) { node.isPart = true; });
    }
    return parts.get();
}

WidgetNode* WidgetNode::FindChild(std::string_view childName) const
{
    for (const auto& child : children)
    {
        if (child->name == childName)
        {
            return child.get();
        }
    }
    return nullptr;
}

WidgetNode* WidgetNode::FindDescendant(std::string_view descendantName) const
{
    for (const auto& child : children)
    {
        if (child->name == descendantName)
        {
            return child.get();
        }
        if (WidgetNode* found = child->FindDescendant(descendantName))
        {
            return found;
        }
    }
    return nullptr;
}

WidgetNode* WidgetNode::FindPart(std::string_view partName) const
{
    if (!parts)
    {
        return nullptr;
    }
    if (parts->name == partName)
    {
        return parts.get();
    }
    return parts->FindDescendant(partName);
}

void WidgetNode::SetProp(const std::string& key, PropValue value)
{
    props[key] = std::move(value);
    MarkNeedsFullReRender();
}

void WidgetNode::DeleteProp(const std::string& key)
{
    if (props.erase(key) > 0)
    {
        MarkNeedsFullReRender();
    }
}

void WidgetNode::AddClass(const std::string& className)
{
    if (!HasClass(className))
    {
        classes.push_back(className);
        MarkNeedsFullReRender();
    }
}

bool WidgetNode::HasClass(const std::string& className) const
{
    return std::find(classes.begin(), classes.end(), className) != classes.end();
}

void WidgetNode::SetVisible(bool visible)
{
    SetProp("visible", visible);
    // The parent allocates space for visible children only.
    if (parent != nullptr)
    {
        parent->MarkNeedsFullReRender();
    }
}

void WidgetNode::SetInactive(bool value)
{
    if (inactive != value)
    {
        inactive = value;
        MarkNeedsFullReRender();
    }
}

void WidgetNode::SetSelected(bool value)
{
    if (selected != value)
    {
        selected = value;
        MarkNeedsFullReRender();
    }
}

void WidgetNode::SetMinPrefWidth(const UnitValue& width)
{
    props["width"] = width;
    SetProp("min-width", width);
}

void WidgetNode::SetMinPrefHeight(const UnitValue& height)
{
    props["height"] = height;
    SetProp("min-height", height);
}

void WidgetNode::SetStretchMaxWidth()
{
    SetProp("max-width", UnitValue::Px(-1.0F));
}

void WidgetNode::SetStretchMaxHeight()
{
    SetProp("max-height", UnitValue::Px(-1.0F));
}

void WidgetNode::SetFixedWidth(const UnitValue& width)
{
    props["width"] = width;
    props["min-width"] = width;
    SetProp("max-width", width);
}

void WidgetNode::SetFixedHeight(const UnitValue& height)
{
    props["height"] = height;
    props["min-height"] = height;
    SetProp("max-height", height);
}

std::string_view WidgetNode::TypeName() const
{
    return type != nullptr ? type->name : std::string_view{"Widget"};
}

std::string_view WidgetNode::StateSelector() const
{
    if (inactive || style.inactive)
    {
        return ":inactive";
    }
    if (pressed)
    {
        return ":active";
    }
    if (selected)
    {
        return ":selected";
    }
    if (hovered)
    {
        return ":hover";
    }
    return {};
}

std::string WidgetNode::Path() const
{
    std::string path = parent != nullptr ? parent->Path() : std::string{};
    path += (isPart && (parent == nullptr || !parent->isPart)) ? "#" : "/";
    path += name;
    return path;
}

BBox WidgetNode::ContentBBox() const
{
    const BBox inner = vpBBox.Inset(static_cast<int>(style.BoxSpace()));
    return inner.Empty() ? BBox{} : inner;
}

bool WidgetNode::IsVisible() const
{
    return style.visible && style.display != Display::None;
}

void WidgetNode::ForEach(const std::function<void(WidgetNode&)>& visit)
{
    visit(*this);
    if (parts)
    {
        parts->ForEach(visit);
    }
    for (const auto& child : children)
    {
        child->ForEach(visit);
    }
}
} // namespace canopy::ui
