#include "canopy/ui/LayoutBox.hpp"

#include <algorithm>

namespace canopy::ui
{
void LayoutData::SetFromStyle(const LayoutStyle& layout)
{
    size.need = glm::vec2{layout.minWidth.dots, layout.minHeight.dots};
    size.pref = glm::vec2{layout.width.dots, layout.height.dots};
    size.max = glm::vec2{layout.maxWidth.dots, layout.maxHeight.dots};
    UpdateSizes();
}

void LayoutData::UpdateSizes()
{
    for (int d = 0; d < 2; ++d)
    {
        size.pref[d] = std::max(size.pref[d], size.need[d]);
        if (size.max[d] > 0.0F)
        {
            size.pref[d] = std::min(size.pref[d], std::max(size.max[d], size.need[d]));
        }
    }
}

glm::vec2 SizeFromWH(const Style& style, float w, float h)
{
    glm::vec2 sz{w, h};
    if (style.layout.width.dots > 0.0F)
    {
        sz.x = style.layout.width.dots;
    }
    if (style.layout.height.dots > 0.0F)
    {
        sz.y = style.layout.height.dots;
    }
    return sz;
}

void SizeAddSpace(LayoutData& layData, float space)
{
    const glm::vec2 extra{2.0F * space, 2.0F * space};
    layData.size.need += extra;
    layData.size.pref += extra;
}
} // namespace canopy::ui
