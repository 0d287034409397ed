#pragma once

#include <optional>
#include <string_view>

#include <glm/vec4.hpp>

namespace canopy::ui
{
// Accepts #rgb, #rgba, #rrggbb, #rrggbbaa, rgb(), rgba(), a few names and
// "none". Components are normalized to [0, 1].
[[nodiscard]] std::optional<glm::vec4> ParseColor(std::string_view text);

[[nodiscard]] inline bool IsNilColor(const glm::vec4& color)
{
    return color.a <= 0.0F;
}
} // namespace canopy::ui
