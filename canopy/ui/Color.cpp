#include "canopy/ui/Color.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <string>
#include <utility>

namespace canopy::ui
{
namespace
{
const std::array<std::pair<std::string_view, glm::vec4>, 15> kNamedColors{{
    {"none", glm::vec4(0.0F, 0.0F, 0.0F, 0.0F)},
    {"transparent", glm::vec4(0.0F, 0.0F, 0.0F, 0.0F)},
    {"white", glm::vec4(1.0F, 1.0F, 1.0F, 1.0F)},
    {"black", glm::vec4(0.0F, 0.0F, 0.0F, 1.0F)},
    {"red", glm::vec4(1.0F, 0.0F, 0.0F, 1.0F)},
    {"green", glm::vec4(0.0F, 0.5F, 0.0F, 1.0F)},
    {"blue", glm::vec4(0.0F, 0.0F, 1.0F, 1.0F)},
    {"yellow", glm::vec4(1.0F, 1.0F, 0.0F, 1.0F)},
    {"cyan", glm::vec4(0.0F, 1.0F, 1.0F, 1.0F)},
    {"magenta", glm::vec4(1.0F, 0.0F, 1.0F, 1.0F)},
    {"gray", glm::vec4(0.5F, 0.5F, 0.5F, 1.0F)},
    {"grey", glm::vec4(0.5F, 0.5F, 0.5F, 1.0F)},
    {"lightgray", glm::vec4(0.83F, 0.83F, 0.83F, 1.0F)},
    {"orange", glm::vec4(1.0F, 0.65F, 0.0F, 1.0F)},
    {"purple", glm::vec4(0.5F, 0.0F, 0.5F, 1.0F)},
}};

std::optional<glm::vec4> ParseHex(const std::string& hex)
{
    std::string digits = hex.substr(1);
    if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isxdigit(c) != 0; }))
    {
        return std::nullopt;
    }
    if (digits.length() == 3 || digits.length() == 4)
    {
        std::string expanded;
        for (char c : digits)
        {
            expanded += std::string(2, c);
        }
        digits = expanded;
    }

    unsigned int r = 0;
    unsigned int g = 0;
    unsigned int b = 0;
    unsigned int a = 255;
    if (digits.length() == 6 && std::sscanf(digits.c_str(), "%02x%02x%02x", &r, &g, &b) == 3)
    {
        return glm::vec4(r / 255.0F, g / 255.0F, b / 255.0F, 1.0F);
    }
    if (digits.length() == 8 && std::sscanf(digits.c_str(), "%02x%02x%02x%02x", &r, &g, &b, &a) == 4)
    {
        return glm::vec4(r / 255.0F, g / 255.0F, b / 255.0F, a / 255.0F);
    }
    return std::nullopt;
}

std::optional<glm::vec4> ParseRgb(const std::string& text)
{
    float r = 0.0F;
    float g = 0.0F;
    float b = 0.0F;
    float a = 1.0F;
    if (text.rfind("rgba", 0) == 0)
    {
        if (std::sscanf(text.c_str(), "rgba(%f,%f,%f,%f)", &r, &g, &b, &a) == 4)
        {
            return glm::vec4(r / 255.0F, g / 255.0F, b / 255.0F, a);
        }
        return std::nullopt;
    }
    if (std::sscanf(text.c_str(), "rgb(%f,%f,%f)", &r, &g, &b) == 3)
    {
        return glm::vec4(r / 255.0F, g / 255.0F, b / 255.0F, 1.0F);
    }
    return std::nullopt;
}
} // namespace

std::optional<glm::vec4> ParseColor(std::string_view text)
{
    std::string value;
    for (char c : text)
    {
        if (std::isspace(static_cast<unsigned char>(c)) == 0)
        {
            value += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    if (value.empty())
    {
        return std::nullopt;
    }
    if (value[0] == '#')
    {
        return ParseHex(value);
    }
    if (value.rfind("rgb", 0) == 0)
    {
        return ParseRgb(value);
    }
    for (const auto& [name, color] : kNamedColors)
    {
        if (value == name)
        {
            return color;
        }
    }
    return std::nullopt;
}
} // namespace canopy::ui
