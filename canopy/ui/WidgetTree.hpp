#pragma once

#include <memory>
#include <string>
#include <vector>

#include <glm/vec2.hpp>

#include "canopy/core/Config.hpp"
#include "canopy/core/EventBus.hpp"
#include "canopy/ui/EventRouter.hpp"
#include "canopy/ui/ReRenderController.hpp"
#include "canopy/ui/StyleContext.hpp"
#include "canopy/ui/StyleResolver.hpp"
#include "canopy/ui/StyleSheet.hpp"
#include "canopy/ui/Units.hpp"
#include "canopy/ui/WidgetNode.hpp"

namespace canopy::ui
{
class RenderSurface;

// Owns a widget hierarchy plus the session state its passes need: style
// cache, resolver, input bindings and the re-render controller.
class WidgetTree
{
public:
    explicit WidgetTree(const core::ToolkitConfig& config);
    ~WidgetTree();

    WidgetTree(const WidgetTree&) = delete;
    WidgetTree& operator=(const WidgetTree&) = delete;

    WidgetNode* SetRoot(std::unique_ptr<WidgetNode> root);
    [[nodiscard]] WidgetNode* Root() { return m_root.get(); }

    // `windowOrigin` offsets viewport boxes into window coordinates.
    void SetSurface(RenderSurface* surface, const glm::ivec2& windowOrigin = glm::ivec2{0, 0});
    [[nodiscard]] RenderSurface* Surface() { return m_surface; }
    [[nodiscard]] const glm::ivec2& WindowOrigin() const { return m_windowOrigin; }

    // All passes on the whole tree and open popups.
    void FullRender();
    // Render pass only; flagged nodes re-run their own passes.
    void Render();

    // Overlay with a label, at most 40em wide and moved to fit the surface.
    WidgetNode* PopupTooltip(const std::string& text, float x, float y);
    void ClosePopups();
    [[nodiscard]] std::size_t PopupCount() const { return m_popups.size(); }

    [[nodiscard]] WidgetNode* FindByName(std::string_view name);

    // Layers a JSON type metadata file over the built-in registrations.
    bool LoadTypeProps(const std::string& path, std::string* outError = nullptr);
    void SetStyleSheet(std::shared_ptr<StyleSheet> sheet);
    [[nodiscard]] const StyleSheet* Sheet() const { return m_sheet.get(); }

    // Routes window input to widgets. Resize requests a full render.
    void HandleInput(const core::InputEvent& event);
    void Subscribe(core::EventBus& bus);

    [[nodiscard]] const core::ToolkitConfig& Config() const { return m_config; }
    [[nodiscard]] StyleContext& Styles() { return m_styles; }
    [[nodiscard]] StyleResolver& Resolver() { return m_resolver; }
    [[nodiscard]] EventRouter& Events() { return m_events; }
    [[nodiscard]] ReRenderController& ReRender() { return m_reRender; }
    [[nodiscard]] UnitContext BaseUnits() const;

private:
    void LayoutRoot();
    void LayoutPopup(WidgetNode& popup, const glm::vec2& pos);

    const core::ToolkitConfig& m_config;
    StyleContext m_styles;
    StyleResolver m_resolver;
    EventRouter m_events;
    ReRenderController m_reRender;
    std::shared_ptr<StyleSheet> m_sheet;

    RenderSurface* m_surface = nullptr;
    glm::ivec2 m_windowOrigin{0, 0};
    glm::ivec2 m_lastSize{0, 0};
    bool m_needsFullRender = true;

    // Declared last so nodes are destroyed while the router still exists.
    std::unique_ptr<WidgetNode> m_root;
    std::vector<std::unique_ptr<WidgetNode>> m_popups;
};
} // namespace canopy::ui
