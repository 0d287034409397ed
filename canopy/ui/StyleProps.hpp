#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <glm/vec4.hpp>

#include "canopy/ui/Style.hpp"
#include "canopy/ui/Units.hpp"

namespace canopy::ui
{
// Loosely typed property value: strings are parsed on apply, numbers are px
// for lengths, and pre-built typed values are taken as is.
using PropValue = std::variant<std::string, double, bool, UnitValue, glm::vec4>;
using Props = std::map<std::string, PropValue, std::less<>>;

// One row of the property table: a key, whether the field is inherited from
// the parent when not overridden, and typed setter/copier functions.
struct StyleField
{
    std::string key;
    bool inherit = false;
    std::function<bool(Style&, const PropValue&)> set;
    std::function<void(Style&, const Style&)> copy;
};

[[nodiscard]] const std::vector<StyleField>& StyleFieldTable();
[[nodiscard]] const StyleField* FindStyleField(std::string_view key);

// Copies every inheritable field from parent.
void InheritStyleFields(Style& style, const Style& parent);

// Applies a property map. "inherit" copies the field from parent (when given)
// and "initial" copies it from `initial`. Values that fail to parse are
// logged and leave the field unchanged; unknown keys are ignored. Returns the
// number of parse failures.
std::size_t ApplyStyleProps(Style& style, const Props& props, const Style* parent, const Style& initial, std::string_view context = {});

[[nodiscard]] std::string PropToString(const PropValue& value);
} // namespace canopy::ui
