#include "canopy/ui/WidgetTree.hpp"

#include <algorithm>
#include <iostream>

#include "canopy/ui/RenderSurface.hpp"
#include "canopy/ui/Widgets.hpp"

namespace canopy::ui
{
namespace
{
constexpr float kTooltipMaxEm = 40.0F;

void ClearReRenderFlags(WidgetNode& node)
{
    node.ForEach([](WidgetNode& n) { n.needsFullReRender = false; });
}
} // namespace

WidgetTree::WidgetTree(const core::ToolkitConfig& config)
    : m_config(config), m_styles(config), m_resolver(m_styles), m_reRender(config.trace)
{
    RegisterBuiltinTypes(m_styles.Types());
}

WidgetTree::~WidgetTree()
{
    m_popups.clear();
    m_root.reset();
}

WidgetNode* WidgetTree::SetRoot(std::unique_ptr<WidgetNode> root)
{
    m_events.Clear();
    m_root = std::move(root);
    if (m_root)
    {
        m_root->parent = nullptr;
        m_root->tree = this;
        m_root->surface = m_surface;
    }
    m_needsFullRender = true;
    return m_root.get();
}

void WidgetTree::SetSurface(RenderSurface* surface, const glm::ivec2& windowOrigin)
{
    m_surface = surface;
    m_windowOrigin = windowOrigin;
    if (m_root)
    {
        m_root->surface = surface;
    }
    for (const auto& popup : m_popups)
    {
        popup->surface = surface;
    }
    m_needsFullRender = true;
}

UnitContext WidgetTree::BaseUnits() const
{
    UnitContext ctx;
    ctx.dotsPerPx = m_config.units.dotsPerPx;
    ctx.fontEm = m_config.units.fontSizePx;
    if (m_surface != nullptr)
    {
        ctx.viewport = glm::vec2(m_surface->Size());
    }
    return ctx;
}

void WidgetTree::LayoutRoot()
{
    m_root->layData.allocPosRel = glm::vec2{0.0F, 0.0F};
    m_root->layData.allocSize = glm::vec2(m_surface->Size());
    m_reRender.LayoutTree(*m_root);
}

void WidgetTree::FullRender()
{
    if (m_surface == nullptr)
    {
        std::cerr << "[Render] FullRender without a render surface\n";
        return;
    }
    m_lastSize = m_surface->Size();
    m_needsFullRender = false;

    if (m_root)
    {
        ClearReRenderFlags(*m_root);
        m_reRender.InitTree(*m_root);
        m_reRender.StyleTree(*m_root);
        m_reRender.SizeTree(*m_root);
        LayoutRoot();
        m_reRender.RenderTree(*m_root);
    }
    for (const auto& popup : m_popups)
    {
        ClearReRenderFlags(*popup);
        m_reRender.InitTree(*popup);
        m_reRender.StyleTree(*popup);
        m_reRender.SizeTree(*popup);
        LayoutPopup(*popup, popup->layData.allocPosRel);
        m_reRender.RenderTree(*popup);
    }
}

void WidgetTree::Render()
{
    if (m_surface == nullptr)
    {
        return;
    }
    if (m_needsFullRender || m_surface->Size() != m_lastSize)
    {
        FullRender();
        return;
    }
    if (m_root)
    {
        m_reRender.RenderTree(*m_root);
    }
    // Handlers may close popups while they render.
    for (std::size_t i = 0; i < m_popups.size(); ++i)
    {
        m_reRender.RenderTree(*m_popups[i]);
    }
}

void WidgetTree::LayoutPopup(WidgetNode& popup, const glm::vec2& pos)
{
    const glm::vec2 surfSize = glm::vec2(m_surface->Size());
    const float maxWidth = popup.style.units.ToDots(kTooltipMaxEm, Unit::Em);
    glm::vec2 size = popup.layData.size.pref;
    size.x = std::min({size.x, maxWidth, surfSize.x});
    size.y = std::min(size.y, surfSize.y);

    glm::vec2 fit = pos;
    for (int d = 0; d < 2; ++d)
    {
        if (fit[d] + size[d] > surfSize[d])
        {
            fit[d] = surfSize[d] - size[d];
        }
        fit[d] = std::max(0.0F, fit[d]);
    }
    popup.layData.allocPosRel = fit;
    popup.layData.allocSize = size;
    m_reRender.LayoutTree(popup);
}

WidgetNode* WidgetTree::PopupTooltip(const std::string& text, float x, float y)
{
    if (m_surface == nullptr || text.empty())
    {
        return nullptr;
    }
    ClosePopups();

    auto frame = NewFrame("tooltip", LayoutDir::Vert);
    frame->AddClass("tooltip");
    frame->overlay = true;
    frame->tree = this;
    frame->surface = m_surface;
    frame->AddChild(NewLabel("tooltip-label", text));

    WidgetNode& popup = *m_popups.emplace_back(std::move(frame));
    ClearReRenderFlags(popup);
    m_reRender.InitTree(popup);
    m_reRender.StyleTree(popup);
    m_reRender.SizeTree(popup);
    LayoutPopup(popup, glm::vec2{x, y});
    return &popup;
}

void WidgetTree::ClosePopups()
{
    for (const auto& popup : m_popups)
    {
        m_events.DisconnectAll(*popup, true);
    }
    m_popups.clear();
}

WidgetNode* WidgetTree::FindByName(std::string_view name)
{
    if (m_root)
    {
        if (m_root->name == name)
        {
            return m_root.get();
        }
        if (WidgetNode* found = m_root->FindDescendant(name))
        {
            return found;
        }
    }
    for (const auto& popup : m_popups)
    {
        if (popup->name == name)
        {
            return popup.get();
        }
        if (WidgetNode* found = popup->FindDescendant(name))
        {
            return found;
        }
    }
    return nullptr;
}

bool WidgetTree::LoadTypeProps(const std::string& path, std::string* outError)
{
    if (!m_styles.Types().LoadFromFile(path, outError))
    {
        return false;
    }
    m_resolver.ClearCache();
    m_needsFullRender = true;
    return true;
}

void WidgetTree::SetStyleSheet(std::shared_ptr<StyleSheet> sheet)
{
    m_sheet = std::move(sheet);
    m_needsFullRender = true;
}

void WidgetTree::HandleInput(const core::InputEvent& event)
{
    if (event.type == core::InputEventType::Resize)
    {
        m_needsFullRender = true;
        return;
    }
    m_events.Dispatch(event);
}

void WidgetTree::Subscribe(core::EventBus& bus)
{
    for (int t = 0; t < static_cast<int>(core::InputEventType::Count); ++t)
    {
        bus.Subscribe(static_cast<core::InputEventType>(t), [this](const core::InputEvent& event) { HandleInput(event); });
    }
}
} // namespace canopy::ui
