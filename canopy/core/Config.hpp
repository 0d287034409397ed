#pragma once

#include <string>

namespace canopy::core
{
// Per-subsystem trace toggles. Owned by the application, never global.
struct TraceConfig
{
    bool style = false;
    bool layout = false;
    bool render = false;
    bool move = false;
    bool mesh = false;
};

struct UnitSettings
{
    float dotsPerPx = 1.0F;
    float fontSizePx = 16.0F;
};

struct WindowConfig
{
    int width = 1280;
    int height = 800;
    bool vsync = true;
    std::string title = "canopy";
};

struct ToolkitConfig
{
    TraceConfig trace;
    UnitSettings units;
    WindowConfig window;

    // Forces cached type-default styles to be recomputed on next use.
    bool rebuildDefaultStyles = false;

    std::string fontPath;
    std::string typePropsPath = "assets/types.json";
    std::string styleSheetPath;
    int meshWorkers = 0;
};

// Reads a JSON config file into `config`. Missing keys keep their current
// values; a missing file is not an error.
bool LoadToolkitConfig(const std::string& path, ToolkitConfig& config, std::string* outError = nullptr);
} // namespace canopy::core
