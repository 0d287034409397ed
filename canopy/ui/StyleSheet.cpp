#include "canopy/ui/StyleSheet.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace canopy::ui
{
namespace
{
using json = nlohmann::json;

bool IsSelectorDelimiter(char c)
{
    return c == '#' || c == '.' || c == ':';
}
} // namespace

int Selector::Specificity() const
{
    int specificity = 0;
    if (!name.empty())
    {
        specificity += 100;
    }
    specificity += 10 * static_cast<int>(classes.size());
    if (!state.empty())
    {
        specificity += 10;
    }
    if (!typeName.empty())
    {
        specificity += 1;
    }
    return specificity;
}

Selector ParseSelector(std::string_view text)
{
    Selector selector;
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0)
    {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0)
    {
        text.remove_suffix(1);
    }
    if (text == "*")
    {
        selector.universal = true;
        return selector;
    }

    std::size_t i = 0;
    while (i < text.size())
    {
        const char lead = text[i];
        const std::size_t start = IsSelectorDelimiter(lead) ? i + 1 : i;
        std::size_t end = start;
        while (end < text.size() && !IsSelectorDelimiter(text[end]))
        {
            ++end;
        }
        const std::string token(text.substr(start, end - start));
        if (!token.empty())
        {
            switch (lead)
            {
                case '#':
                    selector.name = token;
                    break;
                case '.':
                    selector.classes.push_back(token);
                    break;
                case ':':
                    selector.state = token;
                    break;
                default:
                    selector.typeName = token;
                    break;
            }
        }
        i = end;
    }
    return selector;
}

bool SelectorMatches(const Selector& selector, const StyleTarget& target)
{
    if (selector.universal)
    {
        return true;
    }
    if (selector.IsEmpty())
    {
        return false;
    }
    if (!selector.typeName.empty() && selector.typeName != target.typeName)
    {
        return false;
    }
    if (!selector.name.empty() && selector.name != target.name)
    {
        return false;
    }
    if (!selector.state.empty() && selector.state != target.state)
    {
        return false;
    }
    for (const std::string& cls : selector.classes)
    {
        if (target.classes == nullptr || std::find(target.classes->begin(), target.classes->end(), cls) == target.classes->end())
        {
            return false;
        }
    }
    return true;
}

void StyleSheet::AddRule(StyleRule rule)
{
    rule.specificity = rule.selector.Specificity();
    rules.push_back(std::move(rule));
}

std::vector<const StyleRule*> StyleSheet::MatchRules(const StyleTarget& target) const
{
    std::vector<const StyleRule*> matched;
    for (const StyleRule& rule : rules)
    {
        if (SelectorMatches(rule.selector, target))
        {
            matched.push_back(&rule);
        }
    }
    std::stable_sort(matched.begin(), matched.end(), [](const StyleRule* a, const StyleRule* b) {
        return a->specificity < b->specificity;
    });
    return matched;
}

void PropsFromJson(const json& object, Props& outProps)
{
    if (!object.is_object())
    {
        return;
    }
    for (auto it = object.begin(); it != object.end(); ++it)
    {
        const json& value = it.value();
        if (value.is_string())
        {
            outProps[it.key()] = value.get<std::string>();
        }
        else if (value.is_boolean())
        {
            outProps[it.key()] = value.get<bool>();
        }
        else if (value.is_number())
        {
            outProps[it.key()] = value.get<double>();
        }
        else if (value.is_array() && value.size() == 4)
        {
            outProps[it.key()] = glm::vec4{value[0].get<float>(), value[1].get<float>(), value[2].get<float>(), value[3].get<float>()};
        }
    }
}

bool ParseStyleSheet(const std::string& jsonContent, StyleSheet& outStyleSheet, std::string* outError)
{
    try
    {
        const json root = json::parse(jsonContent);
        if (!root.contains("rules") || !root["rules"].is_array())
        {
            if (outError != nullptr)
            {
                *outError = "missing rules array";
            }
            return false;
        }

        outStyleSheet.Clear();
        outStyleSheet.name = root.value("name", std::string{});
        for (const json& ruleJson : root["rules"])
        {
            if (!ruleJson.contains("selector") || !ruleJson["selector"].is_string())
            {
                continue;
            }
            StyleRule rule;
            rule.selector = ParseSelector(ruleJson["selector"].get<std::string>());
            if (rule.selector.IsEmpty())
            {
                continue;
            }
            if (ruleJson.contains("properties"))
            {
                PropsFromJson(ruleJson["properties"], rule.props);
            }
            outStyleSheet.AddRule(std::move(rule));
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

bool LoadStyleSheet(const std::string& path, StyleSheet& outStyleSheet, std::string* outError)
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
    if (!ParseStyleSheet(buffer.str(), outStyleSheet, outError))
    {
        std::cerr << "[Style] Failed to load style sheet " << path << "\n";
        return false;
    }
    std::cout << "[Style] Loaded style sheet " << path << " (" << outStyleSheet.rules.size() << " rules)\n";
    return true;
}
} // namespace canopy::ui
