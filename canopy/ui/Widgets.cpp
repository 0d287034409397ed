#include "canopy/ui/Widgets.hpp"

#include <algorithm>
#include <initializer_list>
#include <utility>
#include <vector>

#include <glm/common.hpp>

#include "canopy/ui/RenderSurface.hpp"
#include "canopy/ui/StyleContext.hpp"
#include "canopy/ui/WidgetTree.hpp"

namespace canopy::ui
{
namespace
{
Props MakeProps(std::initializer_list<std::pair<const char*, const char*>> values)
{
    Props props;
    for (const auto& [key, value] : values)
    {
        props.emplace(key, std::string(value));
    }
    return props;
}

glm::vec4 WithOpacity(glm::vec4 color, float opacity)
{
    color.a *= opacity;
    return color;
}

// Layout containers

LayoutDir DirOf(const WidgetNode& node)
{
    const auto* lay = std::get_if<LayoutContent>(&node.content);
    return lay != nullptr ? lay->dir : LayoutDir::Vert;
}

float AlignOffset(BoxAlign align, float avail, float size)
{
    switch (align)
    {
        case BoxAlign::Center:
            return std::max(0.0F, (avail - size) * 0.5F);
        case BoxAlign::End:
            return std::max(0.0F, avail - size);
        default:
            return 0.0F;
    }
}

void LayoutSize(WidgetNode& node)
{
    const LayoutDir dir = DirOf(node);
    const int main = dir == LayoutDir::Horiz ? 0 : 1;
    const int cross = 1 - main;
    glm::vec2 need{0.0F, 0.0F};
    glm::vec2 pref{0.0F, 0.0F};
    for (const auto& child : node.children)
    {
        if (!child->IsVisible())
        {
            continue;
        }
        const SizePrefs& cs = child->layData.size;
        if (dir == LayoutDir::Stacked)
        {
            need = glm::max(need, cs.need);
            pref = glm::max(pref, cs.pref);
            continue;
        }
        need[main] += cs.need[main];
        pref[main] += cs.pref[main];
        need[cross] = std::max(need[cross], cs.need[cross]);
        pref[cross] = std::max(pref[cross], cs.pref[cross]);
    }
    const float spc = 2.0F * node.style.BoxSpace();
    node.layData.size.need = glm::max(node.layData.size.need, need + spc);
    node.layData.size.pref = glm::max(node.layData.size.pref, pref + spc);
    DefaultSize2D(node);
}

// Children get their preferred size along the main axis; stretch children
// (negative max) share what is left. Across, stretch children fill the
// content box and others are aligned inside it.
void LayoutAllocChildren(WidgetNode& node)
{
    const LayoutDir dir = DirOf(node);
    const float spc = node.style.BoxSpace();
    const glm::vec2 avail = glm::max(node.layData.allocSize - 2.0F * spc, glm::vec2{0.0F, 0.0F});

    if (dir == LayoutDir::Stacked)
    {
        const auto* lay = std::get_if<LayoutContent>(&node.content);
        const int top = lay != nullptr ? lay->stackTop : 0;
        for (std::size_t i = 0; i < node.children.size(); ++i)
        {
            LayoutData& ld = node.children[i]->layData;
            ld.allocPosRel = glm::vec2{spc, spc};
            ld.allocSize = static_cast<int>(i) == top ? avail : glm::vec2{0.0F, 0.0F};
        }
        return;
    }

    const int main = dir == LayoutDir::Horiz ? 0 : 1;
    const int cross = 1 - main;
    float used = 0.0F;
    int stretchCount = 0;
    for (const auto& child : node.children)
    {
        if (!child->IsVisible())
        {
            continue;
        }
        used += child->layData.size.pref[main];
        if (child->layData.size.max[main] < 0.0F)
        {
            ++stretchCount;
        }
    }
    const float extra = stretchCount > 0 ? std::max(0.0F, avail[main] - used) / static_cast<float>(stretchCount) : 0.0F;

    float pos = spc;
    for (const auto& child : node.children)
    {
        LayoutData& ld = child->layData;
        if (!child->IsVisible())
        {
            ld.allocSize = glm::vec2{0.0F, 0.0F};
            ld.allocPosRel = glm::vec2{spc, spc};
            ld.allocPosRel[main] = pos;
            continue;
        }
        glm::vec2 size = ld.size.pref;
        if (ld.size.max[main] < 0.0F)
        {
            size[main] += extra;
        }
        if (ld.size.max[cross] < 0.0F)
        {
            size[cross] = avail[cross];
        }
        else
        {
            size[cross] = std::min(size[cross], avail[cross]);
        }
        const BoxAlign align = cross == 0 ? child->style.layout.alignH : child->style.layout.alignV;
        ld.allocSize = size;
        ld.allocPosRel[main] = pos;
        ld.allocPosRel[cross] = spc + AlignOffset(align, avail[cross], size[cross]);
        pos += size[main];
    }
}

void NoPaint(WidgetNode& /*node*/)
{
}

// Label

const std::string& LabelText(const WidgetNode& node)
{
    static const std::string s_empty;
    const auto* label = std::get_if<LabelContent>(&node.content);
    return label != nullptr ? label->text : s_empty;
}

glm::vec2 MeasureLabel(const WidgetNode& node)
{
    if (node.surface == nullptr)
    {
        return glm::vec2{0.0F, 0.0F};
    }
    return node.surface->MeasureText(LabelText(node), node.style.font.size.dots * node.style.text.lineHeight);
}

void LabelSize(WidgetNode& node)
{
    const glm::vec2 text = MeasureLabel(node);
    const glm::vec2 sz = SizeFromWH(node.style, text.x, text.y);
    LayoutData& ld = node.layData;
    ld.size.need = glm::max(ld.size.need, sz);
    ld.size.pref = glm::max(ld.size.pref, sz);
    SizeAddSpace(ld, node.style.BoxSpace());
    DefaultSize2D(node);
}

void LabelPaint(WidgetNode& node)
{
    RenderStdBox(node);
    const std::string& text = LabelText(node);
    if (text.empty() || node.surface == nullptr)
    {
        return;
    }
    const Style& st = node.style;
    const float spc = st.BoxSpace();
    glm::vec2 pos = node.layData.allocPos + spc;
    const float avail = node.layData.allocSize.x - 2.0F * spc;
    const float width = MeasureLabel(node).x;
    if (st.text.align == TextAlign::Center)
    {
        pos.x += std::max(0.0F, (avail - width) * 0.5F);
    }
    else if (st.text.align == TextAlign::Right)
    {
        pos.x += std::max(0.0F, avail - width);
    }
    if (st.font.backgroundColor.a > 0.0F)
    {
        node.surface->FillRect(pos, MeasureLabel(node), Paint::Solid(WithOpacity(st.font.backgroundColor, st.opacity)));
    }
    node.surface->DrawText(pos, text, st.font.size.dots, WithOpacity(st.color, st.opacity));
}

// Icon

void IconPaint(WidgetNode& node)
{
    RenderStdBox(node);
    const auto* icon = std::get_if<IconContent>(&node.content);
    if (icon == nullptr || icon->icon.empty() || node.surface == nullptr)
    {
        return;
    }
    const Style& st = node.style;
    const float spc = st.BoxSpace();
    const glm::vec2 pos = node.layData.allocPos + spc;
    const glm::vec2 size = node.layData.allocSize - 2.0F * spc;
    if (size.x <= 0.0F || size.y <= 0.0F)
    {
        return;
    }
    const float radius = std::min(size.x, size.y) * 0.25F;
    if (st.fill.a > 0.0F)
    {
        node.surface->FillRoundedRect(pos, size, radius, Paint::Solid(WithOpacity(st.fill, st.opacity)));
    }
    if (st.stroke.a > 0.0F)
    {
        node.surface->StrokeRoundedRect(pos, size, radius, 1.0F, Paint::Solid(WithOpacity(st.stroke, st.opacity)));
    }
}

// Button

void ButtonInit(WidgetNode& node)
{
    DefaultInit2D(node);
    if (const auto* button = std::get_if<ButtonContent>(&node.content))
    {
        ConfigPartsIconLabel(node, button->icon, button->text);
    }
}

void ButtonStyle(WidgetNode& node)
{
    DefaultStyle2D(node);
    StyleParts(node);
}

void ButtonEvents(WidgetNode& node)
{
    WidgetMouseEvents(node, true, true);
    HoverTooltipEvent(node);
}

const WidgetType kLayoutType{.name = "Layout", .size = LayoutSize, .allocChildren = LayoutAllocChildren};
const WidgetType kFrameType{.name = "Frame", .size = LayoutSize, .allocChildren = LayoutAllocChildren};
const WidgetType kLabelType{.name = "Label", .size = LabelSize, .paint = LabelPaint};
const WidgetType kIconType{.name = "Icon", .paint = IconPaint};
const WidgetType kSpaceType{.name = "Space", .paint = NoPaint};
const WidgetType kButtonType{.name = "Button", .init = ButtonInit, .style = ButtonStyle, .connectEvents = ButtonEvents};

std::vector<std::string> IconLabelConfig(const std::string& icon, const std::string& label)
{
    std::vector<std::string> names;
    if (!icon.empty())
    {
        names.emplace_back("icon");
    }
    if (!icon.empty() && !label.empty())
    {
        names.emplace_back("space");
    }
    if (!label.empty())
    {
        names.emplace_back("label");
    }
    return names;
}
} // namespace

const WidgetType& LayoutType()
{
    return kLayoutType;
}

const WidgetType& FrameType()
{
    return kFrameType;
}

const WidgetType& LabelType()
{
    return kLabelType;
}

const WidgetType& IconType()
{
    return kIconType;
}

const WidgetType& SpaceType()
{
    return kSpaceType;
}

const WidgetType& ButtonType()
{
    return kButtonType;
}

void RegisterBuiltinTypes(TypeRegistry& types)
{
    types.Register("Layout", {});
    types.Register("Frame", MakeProps({{"border-width", "1px"}, {"border-color", "#c0c0c0"}, {"padding", "2px"},
                                {"background-color", "#f4f4f4"}}));
    types.RegisterSelector("Frame", ".tooltip",
        MakeProps({{"background-color", "#ffffe0"}, {"border-color", "#808060"}, {"padding", "4px"}, {"border-radius", "2px"},
            {"box-shadow.h-offset", "2px"}, {"box-shadow.v-offset", "2px"}, {"box-shadow.blur", "4px"}}));
    types.Register("Label", MakeProps({{"padding", "2px"}}));
    types.Register("Icon", MakeProps({{"width", "1em"}, {"height", "1em"}, {"fill", "#4060a0"}, {"stroke", "none"}}));
    types.Register("Space", MakeProps({{"width", "0.5em"}, {"height", "1em"}}));

    types.Register("Button", MakeProps({{"border-width", "1px"}, {"border-radius", "4px"}, {"border-color", "#808080"},
                                 {"padding", "4px"}, {"margin", "2px"}, {"background-color", "#e0e0e0"}}));
    types.RegisterSelector("Button", ":hover", MakeProps({{"background-color", "#ececec"}}));
    types.RegisterSelector("Button", ":active", MakeProps({{"background-color", "#c8c8c8"}}));
    types.RegisterSelector("Button", ":selected", MakeProps({{"background-color", "#b0c8f0"}, {"border-color", "#3060c0"}}));
    types.RegisterSelector("Button", ":inactive", MakeProps({{"color", "#909090"}, {"background-color", "#e8e8e8"}}));
    types.RegisterSelector("Button", "#icon", MakeProps({{"fill", "#3060c0"}, {"stroke", "#203050"}}));
    types.RegisterSelector("Button", "#label", MakeProps({{"padding", "0px"}}));
}

std::unique_ptr<WidgetNode> NewLayout(std::string name, LayoutDir dir)
{
    auto node = std::make_unique<WidgetNode>(std::move(name), &kLayoutType);
    node->content = LayoutContent{dir, 0};
    return node;
}

std::unique_ptr<WidgetNode> NewFrame(std::string name, LayoutDir dir)
{
    auto node = std::make_unique<WidgetNode>(std::move(name), &kFrameType);
    node->content = LayoutContent{dir, 0};
    return node;
}

std::unique_ptr<WidgetNode> NewLabel(std::string name, std::string text)
{
    auto node = std::make_unique<WidgetNode>(std::move(name), &kLabelType);
    node->content = LabelContent{std::move(text)};
    return node;
}

std::unique_ptr<WidgetNode> NewIcon(std::string name, std::string icon)
{
    auto node = std::make_unique<WidgetNode>(std::move(name), &kIconType);
    node->content = IconContent{std::move(icon)};
    return node;
}

std::unique_ptr<WidgetNode> NewSpace(std::string name)
{
    auto node = std::make_unique<WidgetNode>(std::move(name), &kSpaceType);
    node->content = SpaceContent{};
    return node;
}

std::unique_ptr<WidgetNode> NewButton(std::string name, std::string text, std::string icon)
{
    auto node = std::make_unique<WidgetNode>(std::move(name), &kButtonType);
    node->content = ButtonContent{std::move(text), std::move(icon)};
    return node;
}

void SetLabelText(WidgetNode& label, const std::string& text)
{
    if (auto* content = std::get_if<LabelContent>(&label.content); content != nullptr && content->text != text)
    {
        content->text = text;
        label.MarkNeedsFullReRender();
    }
}

void SetButtonText(WidgetNode& button, const std::string& text, const std::string& icon)
{
    if (auto* content = std::get_if<ButtonContent>(&button.content))
    {
        content->text = text;
        content->icon = icon;
        button.MarkNeedsFullReRender();
    }
}

void SetStackTop(WidgetNode& layout, int index)
{
    if (auto* content = std::get_if<LayoutContent>(&layout.content); content != nullptr && content->stackTop != index)
    {
        content->stackTop = index;
        layout.MarkNeedsFullReRender();
    }
}

void RenderStdBox(WidgetNode& node)
{
    if (node.surface == nullptr)
    {
        return;
    }
    RenderSurface& surface = *node.surface;
    const Style& st = node.style;
    const float margin = st.layout.margin.dots;
    const glm::vec2 pos = node.layData.allocPos + margin;
    const glm::vec2 size = node.layData.allocSize - 2.0F * margin;
    if (size.x <= 0.0F || size.y <= 0.0F)
    {
        return;
    }
    const float radius = st.border.radius.dots;

    if (st.shadow.HasShadow() && !st.shadow.inset)
    {
        const float spread = st.shadow.spread.dots;
        const glm::vec2 offset{st.shadow.hOffset.dots - spread, st.shadow.vOffset.dots - spread};
        const Paint shadow = Paint::Shadow(WithOpacity(st.shadow.color, st.opacity), st.shadow.blur.dots);
        surface.FillRoundedRect(pos + offset, size + 2.0F * spread, radius, shadow);
    }

    const Paint background = Paint::Solid(WithOpacity(st.background, st.opacity));
    if (!background.IsNone())
    {
        if (radius > 0.0F)
        {
            surface.FillRoundedRect(pos, size, radius, background);
        }
        else
        {
            surface.FillRect(pos, size, background);
        }
    }

    const float bw = st.border.width.dots;
    if (st.border.style != BorderDrawStyle::None && bw > 0.0F)
    {
        const Paint border = Paint::Solid(WithOpacity(st.border.color, st.opacity));
        const glm::vec2 half{bw * 0.5F, bw * 0.5F};
        if (radius > 0.0F)
        {
            surface.StrokeRoundedRect(pos + half, size - bw, radius, bw, border);
        }
        else
        {
            surface.StrokeRect(pos + half, size - bw, bw, border);
        }
    }

    const float ow = st.outline.width.dots;
    if (st.outline.style != BorderDrawStyle::None && ow > 0.0F)
    {
        surface.StrokeRect(pos - ow * 0.5F, size + ow, ow, Paint::Solid(WithOpacity(st.outline.color, st.opacity)));
    }
}

bool PartsNeedUpdateIconLabel(const WidgetNode& node, const std::string& icon, const std::string& label)
{
    if (!node.parts)
    {
        return true;
    }
    const std::vector<std::string> names = IconLabelConfig(icon, label);
    if (names.size() != node.parts->children.size())
    {
        return true;
    }
    for (std::size_t i = 0; i < names.size(); ++i)
    {
        if (node.parts->children[i]->name != names[i])
        {
            return true;
        }
    }
    if (const WidgetNode* iconPart = node.parts->FindChild("icon"))
    {
        const auto* content = std::get_if<IconContent>(&iconPart->content);
        if (content == nullptr || content->icon != icon)
        {
            return true;
        }
    }
    if (const WidgetNode* labelPart = node.parts->FindChild("label"))
    {
        if (LabelText(*labelPart) != label)
        {
            return true;
        }
    }
    return false;
}

bool ConfigPartsIconLabel(WidgetNode& node, const std::string& icon, const std::string& label)
{
    if (!PartsNeedUpdateIconLabel(node, icon, label))
    {
        return false;
    }
    const std::vector<std::string> names = IconLabelConfig(icon, label);
    bool sameShape = node.parts && node.parts->children.size() == names.size();
    for (std::size_t i = 0; sameShape && i < names.size(); ++i)
    {
        sameShape = node.parts->children[i]->name == names[i];
    }
    if (sameShape)
    {
        ConfigPartsSetIconLabel(node, icon, label);
        return false;
    }

    auto partsRoot = NewLayout("parts", LayoutDir::Horiz);
    for (const std::string& partName : names)
    {
        if (partName == "icon")
        {
            partsRoot->AddChild(NewIcon(partName, icon));
        }
        else if (partName == "space")
        {
            partsRoot->AddChild(NewSpace(partName));
        }
        else
        {
            partsRoot->AddChild(NewLabel(partName, label));
        }
    }
    partsRoot->needsFullReRender = false;
    node.SetParts(std::move(partsRoot));
    return true;
}

void ConfigPartsSetIconLabel(WidgetNode& node, const std::string& icon, const std::string& label)
{
    if (!node.parts)
    {
        return;
    }
    if (WidgetNode* iconPart = node.parts->FindChild("icon"))
    {
        iconPart->content = IconContent{icon};
    }
    if (WidgetNode* labelPart = node.parts->FindChild("label"))
    {
        labelPart->content = LabelContent{label};
    }
}

void StyleParts(WidgetNode& node)
{
    if (!node.parts || node.tree == nullptr)
    {
        return;
    }
    StyleResolver& resolver = node.tree->Resolver();
    const std::string_view ownerType = node.TypeName();
    node.parts->ForEach([&resolver, ownerType](WidgetNode& part) {
        part.defStyle = resolver.StylePart(ownerType, part.name, part.TypeName());
    });
}

void WidgetMouseEvents(WidgetNode& node, bool sel, bool ctxtMenu)
{
    if (node.tree == nullptr)
    {
        return;
    }
    EventRouter& events = node.tree->Events();
    events.Connect(node, WidgetEvent::Press, [sel](WidgetNode& target, const core::InputEvent& event) {
        if (event.button != core::MouseButton::Left)
        {
            return;
        }
        target.pressed = true;
        if (target.tree != nullptr)
        {
            target.tree->Events().SetFocus(&target);
        }
        if (sel)
        {
            target.selected = !target.selected;
            target.signals.Emit(WidgetSignal::Selected, target);
        }
        target.MarkNeedsFullReRender();
    });
    events.Connect(node, WidgetEvent::Release, [ctxtMenu](WidgetNode& target, const core::InputEvent& event) {
        if (event.button == core::MouseButton::Left && target.pressed)
        {
            target.pressed = false;
            target.MarkNeedsFullReRender();
            target.signals.Emit(WidgetSignal::Clicked, target);
        }
        else if (event.button == core::MouseButton::Right && ctxtMenu)
        {
            std::vector<MenuItem> items;
            if (target.contextMenu)
            {
                target.contextMenu(target, items);
            }
            target.signals.Emit(WidgetSignal::ContextMenu, target);
        }
    });
}

void HoverTooltipEvent(WidgetNode& node)
{
    if (node.tree == nullptr)
    {
        return;
    }
    EventRouter& events = node.tree->Events();
    events.Connect(node, WidgetEvent::Enter, [](WidgetNode& target, const core::InputEvent& event) {
        target.hovered = true;
        target.MarkNeedsFullReRender();
        if (!target.tooltip.empty() && target.tree != nullptr)
        {
            const glm::vec2 local = event.pos - glm::vec2(target.tree->WindowOrigin());
            target.tree->PopupTooltip(target.tooltip, local.x, local.y + 16.0F);
        }
    });
    events.Connect(node, WidgetEvent::Leave, [](WidgetNode& target, const core::InputEvent& /*event*/) {
        target.hovered = false;
        target.pressed = false;
        target.MarkNeedsFullReRender();
        if (!target.tooltip.empty() && target.tree != nullptr)
        {
            target.tree->ClosePopups();
        }
    });
}
} // namespace canopy::ui
