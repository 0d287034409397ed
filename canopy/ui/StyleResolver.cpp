#include "canopy/ui/StyleResolver.hpp"

#include <cctype>
#include <iostream>

#include "canopy/ui/StyleSheet.hpp"

namespace canopy::ui
{
std::shared_ptr<const Style> StyleResolver::DefaultStyle(std::string_view typeName, std::string_view selector, std::string_view baseType)
{
    std::string key(typeName);
    key += '\x1f';
    key += selector;
    if (auto cached = m_context.FindDefault(key); cached && !m_context.RebuildDefaults())
    {
        return cached;
    }

    Style style;
    style.Defaults();
    const Style universal = style;

    const Props* props = nullptr;
    if (!selector.empty())
    {
        style = *DefaultStyle(baseType.empty() ? typeName : baseType);
        props = m_context.Types().SelectorProps(typeName, selector);
    }
    else
    {
        props = m_context.Types().BaseProps(typeName);
    }
    if (props != nullptr)
    {
        ApplyStyleProps(style, *props, nullptr, universal, key);
    }
    style.resolved = true;

    if (m_context.Config().trace.style)
    {
        std::cout << "[Style] Computed default for " << typeName << (selector.empty() ? "" : " ") << selector << "\n";
    }
    return m_context.StoreDefault(key, style);
}

std::shared_ptr<const Style> StyleResolver::StylePart(std::string_view ownerType, std::string_view partName, std::string_view partType)
{
    std::string selector = "#";
    for (const char c : partName)
    {
        selector += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (m_context.Types().SelectorProps(ownerType, selector) == nullptr)
    {
        return DefaultStyle(partType);
    }
    return DefaultStyle(ownerType, selector, partType);
}

Style StyleResolver::Resolve(const StyleRequest& request)
{
    std::shared_ptr<const Style> typeDefault;
    if (request.defStyle == nullptr)
    {
        typeDefault = DefaultStyle(request.typeName, request.selector);
    }
    const Style& base = request.defStyle != nullptr ? *request.defStyle : *typeDefault;

    Style style = base;
    if (request.parent != nullptr)
    {
        InheritStyleFields(style, *request.parent);
    }

    std::string context(request.typeName);
    if (!request.name.empty())
    {
        context += " ";
        context += request.name;
    }

    if (request.instanceProps != nullptr)
    {
        ApplyStyleProps(style, *request.instanceProps, request.parent, base, context);
    }

    if (request.classes != nullptr)
    {
        for (const std::string& cls : *request.classes)
        {
            if (const Props* props = m_context.Types().SelectorProps(request.typeName, "." + cls))
            {
                ApplyStyleProps(style, *props, request.parent, base, context);
            }
        }
    }

    if (request.sheets != nullptr)
    {
        StyleTarget target;
        target.typeName = request.typeName;
        target.name = request.name;
        target.classes = request.classes;
        if (!request.selector.empty() && request.selector.front() == ':')
        {
            target.state = request.selector.substr(1);
        }
        for (const StyleSheet* sheet : *request.sheets)
        {
            for (const StyleRule* rule : sheet->MatchRules(target))
            {
                ApplyStyleProps(style, rule->props, request.parent, base, context);
            }
        }
    }

    style.resolved = true;
    return style;
}
} // namespace canopy::ui
