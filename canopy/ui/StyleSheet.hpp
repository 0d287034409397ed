#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "canopy/ui/StyleProps.hpp"

namespace canopy::ui
{
// Compound selector: optional type, #name, any number of .classes and an
// optional :state, e.g. "Button.primary:hover". "*" matches everything.
struct Selector
{
    std::string typeName;
    std::string name;
    std::vector<std::string> classes;
    std::string state;
    bool universal = false;

    [[nodiscard]] bool IsEmpty() const
    {
        return !universal && typeName.empty() && name.empty() && classes.empty() && state.empty();
    }
    [[nodiscard]] int Specificity() const;
};

// What a selector is matched against.
struct StyleTarget
{
    std::string_view typeName;
    std::string_view name;
    const std::vector<std::string>* classes = nullptr;
    std::string_view state;
};

struct StyleRule
{
    Selector selector;
    Props props;
    int specificity = 0;
};

class StyleSheet
{
public:
    std::string name;
    std::vector<StyleRule> rules;

    void AddRule(StyleRule rule);
    void Clear() { rules.clear(); }

    // Matching rules, lowest specificity first so later ones override.
    [[nodiscard]] std::vector<const StyleRule*> MatchRules(const StyleTarget& target) const;
};

[[nodiscard]] Selector ParseSelector(std::string_view text);
[[nodiscard]] bool SelectorMatches(const Selector& selector, const StyleTarget& target);

// JSON: { "rules": [ { "selector": "Button.primary", "properties": { ... } } ] }
bool ParseStyleSheet(const std::string& jsonContent, StyleSheet& outStyleSheet, std::string* outError = nullptr);
bool LoadStyleSheet(const std::string& path, StyleSheet& outStyleSheet, std::string* outError = nullptr);

// Converts a JSON object of scalar values into a property map.
void PropsFromJson(const nlohmann::json& object, Props& outProps);
} // namespace canopy::ui
