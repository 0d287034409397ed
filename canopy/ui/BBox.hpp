#pragma once

#include <algorithm>
#include <cmath>

#include <glm/vec2.hpp>

namespace canopy::ui
{
// Integer pixel rectangle, max exclusive.
struct BBox
{
    glm::ivec2 min{0, 0};
    glm::ivec2 max{0, 0};

    [[nodiscard]] static BBox FromPosSize(const glm::vec2& pos, const glm::vec2& size)
    {
        const glm::ivec2 lo{static_cast<int>(std::floor(pos.x)), static_cast<int>(std::floor(pos.y))};
        const glm::ivec2 hi{static_cast<int>(std::ceil(pos.x + size.x)), static_cast<int>(std::ceil(pos.y + size.y))};
        return BBox{lo, hi};
    }

    [[nodiscard]] bool Empty() const
    {
        return max.x <= min.x || max.y <= min.y;
    }

    [[nodiscard]] glm::ivec2 Size() const
    {
        return glm::ivec2{std::max(0, max.x - min.x), std::max(0, max.y - min.y)};
    }

    [[nodiscard]] BBox Intersect(const BBox& other) const
    {
        BBox out{glm::ivec2{std::max(min.x, other.min.x), std::max(min.y, other.min.y)},
            glm::ivec2{std::min(max.x, other.max.x), std::min(max.y, other.max.y)}};
        if (out.Empty())
        {
            return BBox{};
        }
        return out;
    }

    [[nodiscard]] BBox Translated(const glm::ivec2& delta) const
    {
        return BBox{min + delta, max + delta};
    }

    [[nodiscard]] BBox Inset(int amount) const
    {
        return BBox{min + glm::ivec2{amount, amount}, max - glm::ivec2{amount, amount}};
    }

    [[nodiscard]] bool Contains(const glm::vec2& p) const
    {
        return p.x >= static_cast<float>(min.x) && p.y >= static_cast<float>(min.y)
            && p.x < static_cast<float>(max.x) && p.y < static_cast<float>(max.y);
    }

    bool operator==(const BBox& other) const
    {
        return min == other.min && max == other.max;
    }
    bool operator!=(const BBox& other) const
    {
        return !(*this == other);
    }
};
} // namespace canopy::ui
