#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "canopy/ui/Style.hpp"
#include "canopy/ui/StyleContext.hpp"
#include "canopy/ui/StyleProps.hpp"

namespace canopy::ui
{
class StyleSheet;

struct StyleRequest
{
    std::string_view typeName;
    // Optional sub-variant of the type default: "#part" or ":state".
    std::string_view selector;
    std::string_view name;
    const Style* parent = nullptr;
    // Default handed down by a compound widget to one of its parts. Replaces
    // the type default when set.
    const Style* defStyle = nullptr;
    const Props* instanceProps = nullptr;
    const std::vector<std::string>* classes = nullptr;
    const std::vector<const StyleSheet*>* sheets = nullptr;
};

class StyleResolver
{
public:
    explicit StyleResolver(StyleContext& context) : m_context(context) {}

    // Cached default for (typeName, selector). With a selector, the unselected
    // default of `baseType` (or typeName) is the starting point and the
    // selector's sub-map is applied on top; a missing sub-map yields the
    // unselected default.
    std::shared_ptr<const Style> DefaultStyle(std::string_view typeName, std::string_view selector = {}, std::string_view baseType = {});

    // Type default, then inherited fields from the parent, then instance
    // props, then class sub-maps from type metadata, then matching style
    // sheet rules.
    [[nodiscard]] Style Resolve(const StyleRequest& request);

    // Default for a part named `partName` of an `ownerType` widget: the
    // owner's "#partname" sub-map over the part type's own default, or the
    // part type's plain default when the owner defines no such sub-map.
    std::shared_ptr<const Style> StylePart(std::string_view ownerType, std::string_view partName, std::string_view partType);

    void ClearCache() { m_context.ClearCache(); }

    [[nodiscard]] StyleContext& Context() { return m_context; }

private:
    StyleContext& m_context;
};
} // namespace canopy::ui
