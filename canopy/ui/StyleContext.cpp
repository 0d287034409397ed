#include "canopy/ui/StyleContext.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "canopy/ui/StyleSheet.hpp"

namespace canopy::ui
{
namespace
{
using json = nlohmann::json;

bool IsSelectorKey(const std::string& key)
{
    return !key.empty() && (key[0] == '#' || key[0] == '.' || key[0] == ':');
}
} // namespace

void TypeRegistry::Register(const std::string& typeName, const Props& base)
{
    TypeProps& type = m_types[typeName];
    for (const auto& [key, value] : base)
    {
        type.base[key] = value;
    }
}

void TypeRegistry::RegisterSelector(const std::string& typeName, const std::string& selector, const Props& props)
{
    Props& target = m_types[typeName].selectors[selector];
    for (const auto& [key, value] : props)
    {
        target[key] = value;
    }
}

const Props* TypeRegistry::BaseProps(std::string_view typeName) const
{
    const auto it = m_types.find(typeName);
    return it != m_types.end() ? &it->second.base : nullptr;
}

const Props* TypeRegistry::SelectorProps(std::string_view typeName, std::string_view selector) const
{
    const auto it = m_types.find(typeName);
    if (it == m_types.end())
    {
        return nullptr;
    }
    const auto sel = it->second.selectors.find(selector);
    return sel != it->second.selectors.end() ? &sel->second : nullptr;
}

bool TypeRegistry::HasType(std::string_view typeName) const
{
    return m_types.find(typeName) != m_types.end();
}

bool TypeRegistry::LoadFromJson(const std::string& jsonContent, std::string* outError)
{
    try
    {
        const json root = json::parse(jsonContent);
        if (!root.contains("types") || !root["types"].is_object())
        {
            if (outError != nullptr)
            {
                *outError = "missing types object";
            }
            return false;
        }
        for (auto typeIt = root["types"].begin(); typeIt != root["types"].end(); ++typeIt)
        {
            Props base;
            PropsFromJson(typeIt.value(), base);
            Register(typeIt.key(), base);
            for (auto it = typeIt.value().begin(); it != typeIt.value().end(); ++it)
            {
                if (IsSelectorKey(it.key()) && it.value().is_object())
                {
                    Props sub;
                    PropsFromJson(it.value(), sub);
                    RegisterSelector(typeIt.key(), it.key(), sub);
                }
            }
        }
    }
    catch (const json::exception& ex)
    {
        if (outError != nullptr)
        {
            *outError = ex.what();
        }
        return false;
    }
    return true;
}

bool TypeRegistry::LoadFromFile(const std::string& path, std::string* outError)
{
    std::ifstream stream(path);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "cannot open " + path;
        }
        return false;
    }
    std::stringstream buffer;
    buffer << stream.rdbuf();
    std::string error;
    if (!LoadFromJson(buffer.str(), &error))
    {
        std::cerr << "[Style] Failed to load type props " << path << ": " << error << "\n";
        if (outError != nullptr)
        {
            *outError = error;
        }
        return false;
    }
    std::cout << "[Style] Loaded type props " << path << "\n";
    return true;
}

StyleContext::StyleContext(const core::ToolkitConfig& config) : m_config(config) {}

std::shared_ptr<Style> StyleContext::FindDefault(const std::string& key) const
{
    const auto it = m_defaults.find(key);
    return it != m_defaults.end() ? it->second : nullptr;
}

std::shared_ptr<Style> StyleContext::StoreDefault(const std::string& key, const Style& style)
{
    ++m_computeCount;
    std::shared_ptr<Style>& slot = m_defaults[key];
    // Recomputed defaults are written in place so holders see the update.
    if (!slot)
    {
        slot = std::make_shared<Style>(style);
    }
    else
    {
        *slot = style;
    }
    return slot;
}

void StyleContext::ClearCache()
{
    m_defaults.clear();
}
} // namespace canopy::ui
