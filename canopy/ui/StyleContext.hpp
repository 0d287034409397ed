#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <string_view>

#include "canopy/core/Config.hpp"
#include "canopy/ui/Style.hpp"
#include "canopy/ui/StyleProps.hpp"

namespace canopy::ui
{
// Compiled default properties per widget type, plus selector-scoped
// sub-maps keyed "#part", ".class" or ":state".
struct TypeProps
{
    Props base;
    std::map<std::string, Props, std::less<>> selectors;
};

class TypeRegistry
{
public:
    void Register(const std::string& typeName, const Props& base);
    void RegisterSelector(const std::string& typeName, const std::string& selector, const Props& props);

    [[nodiscard]] const Props* BaseProps(std::string_view typeName) const;
    [[nodiscard]] const Props* SelectorProps(std::string_view typeName, std::string_view selector) const;
    [[nodiscard]] bool HasType(std::string_view typeName) const;

    // JSON: { "types": { "Button": { "padding": "4px", "#icon": { ... } } } }
    // Merges over what is already registered.
    bool LoadFromJson(const std::string& jsonContent, std::string* outError = nullptr);
    bool LoadFromFile(const std::string& path, std::string* outError = nullptr);

private:
    std::map<std::string, TypeProps, std::less<>> m_types;
};

// Session-scoped style state: the type registry and the cache of computed
// type-default styles. One per widget tree; never process-wide.
class StyleContext
{
public:
    explicit StyleContext(const core::ToolkitConfig& config);

    StyleContext(const StyleContext&) = delete;
    StyleContext& operator=(const StyleContext&) = delete;

    [[nodiscard]] TypeRegistry& Types() { return m_types; }
    [[nodiscard]] const TypeRegistry& Types() const { return m_types; }
    [[nodiscard]] const core::ToolkitConfig& Config() const { return m_config; }
    [[nodiscard]] bool RebuildDefaults() const { return m_config.rebuildDefaultStyles; }

    [[nodiscard]] std::shared_ptr<Style> FindDefault(const std::string& key) const;
    std::shared_ptr<Style> StoreDefault(const std::string& key, const Style& style);
    void ClearCache();

    [[nodiscard]] std::size_t CacheSize() const { return m_defaults.size(); }
    [[nodiscard]] std::size_t ComputeCount() const { return m_computeCount; }

private:
    const core::ToolkitConfig& m_config;
    TypeRegistry m_types;
    std::map<std::string, std::shared_ptr<Style>> m_defaults;
    std::size_t m_computeCount = 0;
};
} // namespace canopy::ui
