#include "canopy/core/Config.hpp"

#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

namespace canopy::core
{
namespace
{
using json = nlohmann::json;

void ReadTrace(const json& root, TraceConfig& trace)
{
    if (!root.contains("trace") || !root["trace"].is_object())
    {
        return;
    }
    const json& t = root["trace"];
    trace.style = t.value("style", trace.style);
    trace.layout = t.value("layout", trace.layout);
    trace.render = t.value("render", trace.render);
    trace.move = t.value("move", trace.move);
    trace.mesh = t.value("mesh", trace.mesh);
}

void ReadWindow(const json& root, WindowConfig& window)
{
    if (!root.contains("window") || !root["window"].is_object())
    {
        return;
    }
    const json& w = root["window"];
    window.width = w.value("width", window.width);
    window.height = w.value("height", window.height);
    window.vsync = w.value("vsync", window.vsync);
    window.title = w.value("title", window.title);
}
} // namespace

bool LoadToolkitConfig(const std::string& path, ToolkitConfig& config, std::string* outError)
{
    std::ifstream stream(path);
    if (!stream.is_open())
    {
        std::cout << "[Config] No config at " << path << ", using defaults\n";
        return true;
    }

    try
    {
        json root;
        stream >> root;

        ReadTrace(root, config.trace);
        ReadWindow(root, config.window);
        if (root.contains("units") && root["units"].is_object())
        {
            const json& u = root["units"];
            config.units.dotsPerPx = u.value("dots_per_px", config.units.dotsPerPx);
            config.units.fontSizePx = u.value("font_size_px", config.units.fontSizePx);
        }
        config.rebuildDefaultStyles = root.value("rebuild_default_styles", config.rebuildDefaultStyles);
        config.fontPath = root.value("font_path", config.fontPath);
        config.typePropsPath = root.value("type_props_path", config.typePropsPath);
        config.styleSheetPath = root.value("style_sheet_path", config.styleSheetPath);
        config.meshWorkers = root.value("mesh_workers", config.meshWorkers);
    }
    catch (const json::exception& ex)
    {
        if (outError != nullptr)
        {
            *outError = path + ": " + ex.what();
        }
        std::cerr << "[Config] Failed to parse " << path << ": " << ex.what() << "\n";
        return false;
    }

    std::cout << "[Config] Loaded " << path << "\n";
    return true;
}
} // namespace canopy::core
