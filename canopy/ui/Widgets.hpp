#pragma once

#include <memory>
#include <string>

#include "canopy/ui/Lifecycle.hpp"
#include "canopy/ui/WidgetNode.hpp"

namespace canopy::ui
{
class TypeRegistry;

[[nodiscard]] const WidgetType& LayoutType();
[[nodiscard]] const WidgetType& FrameType();
[[nodiscard]] const WidgetType& LabelType();
[[nodiscard]] const WidgetType& IconType();
[[nodiscard]] const WidgetType& SpaceType();
[[nodiscard]] const WidgetType& ButtonType();

// Default property maps of the built-in types, including their part and
// state sub-maps.
void RegisterBuiltinTypes(TypeRegistry& types);

// Factories
std::unique_ptr<WidgetNode> NewLayout(std::string name, LayoutDir dir = LayoutDir::Vert);
// Layout that draws a box.
std::unique_ptr<WidgetNode> NewFrame(std::string name, LayoutDir dir = LayoutDir::Vert);
std::unique_ptr<WidgetNode> NewLabel(std::string name, std::string text);
std::unique_ptr<WidgetNode> NewIcon(std::string name, std::string icon);
std::unique_ptr<WidgetNode> NewSpace(std::string name);
std::unique_ptr<WidgetNode> NewButton(std::string name, std::string text, std::string icon = {});

void SetLabelText(WidgetNode& label, const std::string& text);
void SetButtonText(WidgetNode& button, const std::string& text, const std::string& icon);
void SetStackTop(WidgetNode& layout, int index);

// Shadow, background and border of the node's box, rounded when the border
// radius is positive.
void RenderStdBox(WidgetNode& node);

// Parts made of an optional icon, a space and an optional label in a
// horizontal layout. Returns true when the parts were rebuilt.
bool ConfigPartsIconLabel(WidgetNode& node, const std::string& icon, const std::string& label);
// Copies icon and label values into existing parts.
void ConfigPartsSetIconLabel(WidgetNode& node, const std::string& icon, const std::string& label);
[[nodiscard]] bool PartsNeedUpdateIconLabel(const WidgetNode& node, const std::string& icon, const std::string& label);
// Gives every part the owner's "#partname" default.
void StyleParts(WidgetNode& node);

// Left press toggles selection when `sel`; right release opens the context
// menu when `ctxtMenu`; left release after a press emits Clicked.
void WidgetMouseEvents(WidgetNode& node, bool sel, bool ctxtMenu);
// Hover state, plus the node's tooltip while the pointer is over it.
void HoverTooltipEvent(WidgetNode& node);
} // namespace canopy::ui
