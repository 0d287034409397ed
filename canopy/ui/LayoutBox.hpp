#pragma once

#include <glm/vec2.hpp>

#include "canopy/ui/BBox.hpp"
#include "canopy/ui/Style.hpp"

namespace canopy::ui
{
struct SizePrefs
{
    glm::vec2 need{0.0F, 0.0F};
    glm::vec2 pref{0.0F, 0.0F};
    // Zero means unconstrained; negative means stretch to fill.
    glm::vec2 max{0.0F, 0.0F};
};

// Allocated geometry of one node. allocPos is absolute; allocPosOrig is the
// value captured at layout time and is the baseline for moves.
struct LayoutData
{
    glm::vec2 allocPos{0.0F, 0.0F};
    glm::vec2 allocPosRel{0.0F, 0.0F};
    glm::vec2 allocPosOrig{0.0F, 0.0F};
    glm::vec2 allocSize{0.0F, 0.0F};
    SizePrefs size;

    void Reset()
    {
        *this = LayoutData{};
    }

    // Takes min, preferred and max sizes from the resolved style.
    void SetFromStyle(const LayoutStyle& layout);

    // Keeps pref within [need, max] where max is a positive bound.
    void UpdateSizes();

    [[nodiscard]] bool StretchWidth() const { return size.max.x < 0.0F; }
    [[nodiscard]] bool StretchHeight() const { return size.max.y < 0.0F; }
};

// Standard box-model size helpers shared by widget types.
[[nodiscard]] glm::vec2 SizeFromWH(const Style& style, float w, float h);
void SizeAddSpace(LayoutData& layData, float space);

[[nodiscard]] inline BBox BBoxFromLayout(const LayoutData& layData)
{
    return BBox::FromPosSize(layData.allocPos, layData.allocSize);
}
} // namespace canopy::ui
