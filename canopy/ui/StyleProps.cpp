#include "canopy/ui/StyleProps.hpp"

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include "canopy/ui/Color.hpp"

namespace canopy::ui
{
namespace
{
template <typename E>
using EnumNames = std::vector<std::pair<std::string_view, E>>;

bool ReadUnit(const PropValue& value, UnitValue& out)
{
    if (const auto* unit = std::get_if<UnitValue>(&value))
    {
        out = *unit;
        return true;
    }
    if (const auto* number = std::get_if<double>(&value))
    {
        out = UnitValue::Px(static_cast<float>(*number));
        return true;
    }
    if (const auto* text = std::get_if<std::string>(&value))
    {
        if (*text == "auto" || *text == "none")
        {
            out = UnitValue{};
            return true;
        }
        if (const auto parsed = ParseUnitValue(*text))
        {
            out = *parsed;
            return true;
        }
    }
    return false;
}

bool ReadColor(const PropValue& value, glm::vec4& out)
{
    if (const auto* color = std::get_if<glm::vec4>(&value))
    {
        out = *color;
        return true;
    }
    if (const auto* text = std::get_if<std::string>(&value))
    {
        if (const auto parsed = ParseColor(*text))
        {
            out = *parsed;
            return true;
        }
    }
    return false;
}

bool ReadFloat(const PropValue& value, float& out)
{
    if (const auto* number = std::get_if<double>(&value))
    {
        out = static_cast<float>(*number);
        return true;
    }
    if (const auto* text = std::get_if<std::string>(&value))
    {
        char* end = nullptr;
        const float parsed = std::strtof(text->c_str(), &end);
        if (end != text->c_str() && *end == '\0')
        {
            out = parsed;
            return true;
        }
    }
    return false;
}

bool ReadBool(const PropValue& value, bool& out)
{
    if (const auto* flag = std::get_if<bool>(&value))
    {
        out = *flag;
        return true;
    }
    if (const auto* number = std::get_if<double>(&value))
    {
        out = *number != 0.0;
        return true;
    }
    if (const auto* text = std::get_if<std::string>(&value))
    {
        if (*text == "true" || *text == "1" || *text == "yes")
        {
            out = true;
            return true;
        }
        if (*text == "false" || *text == "0" || *text == "no")
        {
            out = false;
            return true;
        }
    }
    return false;
}

bool ReadString(const PropValue& value, std::string& out)
{
    if (const auto* text = std::get_if<std::string>(&value))
    {
        out = *text;
        return true;
    }
    return false;
}

template <typename E>
bool ReadEnum(const PropValue& value, E& out, const EnumNames<E>& names)
{
    const auto* text = std::get_if<std::string>(&value);
    if (text == nullptr)
    {
        return false;
    }
    for (const auto& [name, e] : names)
    {
        if (*text == name)
        {
            out = e;
            return true;
        }
    }
    return false;
}

// `access` is a generic lambda returning a reference to the field, so the
// same accessor serves the setter (mutable Style) and the copier (const).
template <typename Read, typename Access>
StyleField MakeField(std::string key, bool inherit, Read read, Access access)
{
    return StyleField{
        std::move(key),
        inherit,
        [read, access](Style& style, const PropValue& value) { return read(value, access(style)); },
        [access](Style& dst, const Style& src) { access(dst) = access(src); },
    };
}

template <typename Access>
StyleField UnitField(std::string key, Access access, bool inherit = false)
{
    return MakeField(std::move(key), inherit, ReadUnit, access);
}

template <typename Access>
StyleField ColorField(std::string key, Access access, bool inherit = false)
{
    return MakeField(std::move(key), inherit, ReadColor, access);
}

template <typename Access>
StyleField BoolField(std::string key, Access access, bool inherit = false)
{
    return MakeField(std::move(key), inherit, ReadBool, access);
}

template <typename E, typename Access>
StyleField EnumField(std::string key, EnumNames<E> names, Access access, bool inherit = false)
{
    auto read = [names = std::move(names)](const PropValue& value, E& out) { return ReadEnum(value, out, names); };
    return MakeField(std::move(key), inherit, read, access);
}

bool ReadPointerEvents(const PropValue& value, bool& out)
{
    if (const auto* text = std::get_if<std::string>(&value))
    {
        if (*text == "none")
        {
            out = false;
            return true;
        }
        if (*text == "auto")
        {
            out = true;
            return true;
        }
    }
    return ReadBool(value, out);
}

const EnumNames<BorderDrawStyle> kBorderStyles{
    {"solid", BorderDrawStyle::Solid},
    {"dotted", BorderDrawStyle::Dotted},
    {"dashed", BorderDrawStyle::Dashed},
    {"double", BorderDrawStyle::Double},
    {"none", BorderDrawStyle::None},
};

const EnumNames<BoxAlign> kAligns{
    {"left", BoxAlign::Start},
    {"top", BoxAlign::Start},
    {"start", BoxAlign::Start},
    {"center", BoxAlign::Center},
    {"middle", BoxAlign::Center},
    {"right", BoxAlign::End},
    {"bottom", BoxAlign::End},
    {"end", BoxAlign::End},
};

std::vector<StyleField> BuildFieldTable()
{
    std::vector<StyleField> t;
    t.push_back(EnumField<Display>("display", {{"inline", Display::Inline}, {"block", Display::Block}, {"none", Display::None}},
        [](auto& s) -> auto& { return s.display; }));
    t.push_back(BoolField("visible", [](auto& s) -> auto& { return s.visible; }));
    t.push_back(BoolField("inactive", [](auto& s) -> auto& { return s.inactive; }));
    t.push_back(MakeField("pointer-events", true, ReadPointerEvents, [](auto& s) -> auto& { return s.pointerEvents; }));
    t.push_back(MakeField("opacity", false, ReadFloat, [](auto& s) -> auto& { return s.opacity; }));

    t.push_back(ColorField("color", [](auto& s) -> auto& { return s.color; }, true));
    t.push_back(ColorField("background-color", [](auto& s) -> auto& { return s.background; }));
    t.push_back(ColorField("fill", [](auto& s) -> auto& { return s.fill; }));
    t.push_back(ColorField("stroke", [](auto& s) -> auto& { return s.stroke; }));

    t.push_back(EnumField<BorderDrawStyle>("border-style", kBorderStyles, [](auto& s) -> auto& { return s.border.style; }));
    t.push_back(UnitField("border-width", [](auto& s) -> auto& { return s.border.width; }));
    t.push_back(UnitField("border-radius", [](auto& s) -> auto& { return s.border.radius; }));
    t.push_back(ColorField("border-color", [](auto& s) -> auto& { return s.border.color; }));
    t.push_back(EnumField<BorderDrawStyle>("outline-style", kBorderStyles, [](auto& s) -> auto& { return s.outline.style; }));
    t.push_back(UnitField("outline-width", [](auto& s) -> auto& { return s.outline.width; }));
    t.push_back(ColorField("outline-color", [](auto& s) -> auto& { return s.outline.color; }));

    t.push_back(UnitField("box-shadow.h-offset", [](auto& s) -> auto& { return s.shadow.hOffset; }));
    t.push_back(UnitField("box-shadow.v-offset", [](auto& s) -> auto& { return s.shadow.vOffset; }));
    t.push_back(UnitField("box-shadow.blur", [](auto& s) -> auto& { return s.shadow.blur; }));
    t.push_back(UnitField("box-shadow.spread", [](auto& s) -> auto& { return s.shadow.spread; }));
    t.push_back(ColorField("box-shadow.color", [](auto& s) -> auto& { return s.shadow.color; }));
    t.push_back(BoolField("box-shadow.inset", [](auto& s) -> auto& { return s.shadow.inset; }));

    t.push_back(UnitField("margin", [](auto& s) -> auto& { return s.layout.margin; }));
    t.push_back(UnitField("padding", [](auto& s) -> auto& { return s.padding; }));

    t.push_back(MakeField("font-family", true, ReadString, [](auto& s) -> auto& { return s.font.family; }));
    t.push_back(UnitField("font-size", [](auto& s) -> auto& { return s.font.size; }, true));
    t.push_back(EnumField<FontWeight>("font-weight", {{"normal", FontWeight::Normal}, {"light", FontWeight::Light}, {"bold", FontWeight::Bold}},
        [](auto& s) -> auto& { return s.font.weight; }, true));
    t.push_back(EnumField<FontSlant>("font-style", {{"normal", FontSlant::Normal}, {"italic", FontSlant::Italic}},
        [](auto& s) -> auto& { return s.font.slant; }, true));
    t.push_back(ColorField("font-background-color", [](auto& s) -> auto& { return s.font.backgroundColor; }));
    t.push_back(EnumField<TextAlign>("text-align",
        {{"left", TextAlign::Left}, {"center", TextAlign::Center}, {"right", TextAlign::Right}, {"justify", TextAlign::Justify}},
        [](auto& s) -> auto& { return s.text.align; }, true));
    t.push_back(BoolField("word-wrap", [](auto& s) -> auto& { return s.text.wordWrap; }, true));
    t.push_back(MakeField("line-height", true, ReadFloat, [](auto& s) -> auto& { return s.text.lineHeight; }));

    t.push_back(UnitField("width", [](auto& s) -> auto& { return s.layout.width; }));
    t.push_back(UnitField("height", [](auto& s) -> auto& { return s.layout.height; }));
    t.push_back(UnitField("min-width", [](auto& s) -> auto& { return s.layout.minWidth; }));
    t.push_back(UnitField("min-height", [](auto& s) -> auto& { return s.layout.minHeight; }));
    t.push_back(UnitField("max-width", [](auto& s) -> auto& { return s.layout.maxWidth; }));
    t.push_back(UnitField("max-height", [](auto& s) -> auto& { return s.layout.maxHeight; }));
    t.push_back(UnitField("x", [](auto& s) -> auto& { return s.layout.posX; }));
    t.push_back(UnitField("y", [](auto& s) -> auto& { return s.layout.posY; }));
    t.push_back(EnumField<BoxAlign>("horizontal-align", kAligns, [](auto& s) -> auto& { return s.layout.alignH; }));
    t.push_back(EnumField<BoxAlign>("vertical-align", kAligns, [](auto& s) -> auto& { return s.layout.alignV; }));
    return t;
}
} // namespace

const std::vector<StyleField>& StyleFieldTable()
{
    static const std::vector<StyleField> s_table = BuildFieldTable();
    return s_table;
}

const StyleField* FindStyleField(std::string_view key)
{
    static const std::unordered_map<std::string_view, const StyleField*> s_index = []() {
        std::unordered_map<std::string_view, const StyleField*> index;
        for (const StyleField& field : StyleFieldTable())
        {
            index.emplace(field.key, &field);
        }
        return index;
    }();
    const auto it = s_index.find(key);
    return it != s_index.end() ? it->second : nullptr;
}

void InheritStyleFields(Style& style, const Style& parent)
{
    for (const StyleField& field : StyleFieldTable())
    {
        if (field.inherit)
        {
            field.copy(style, parent);
        }
    }
}

std::size_t ApplyStyleProps(Style& style, const Props& props, const Style* parent, const Style& initial, std::string_view context)
{
    std::size_t failures = 0;
    for (const auto& [key, value] : props)
    {
        const StyleField* field = FindStyleField(key);
        if (field == nullptr)
        {
            continue;
        }
        if (const auto* keyword = std::get_if<std::string>(&value))
        {
            if (*keyword == "inherit")
            {
                if (parent != nullptr)
                {
                    field->copy(style, *parent);
                }
                continue;
            }
            if (*keyword == "initial")
            {
                field->copy(style, initial);
                continue;
            }
        }
        if (!field->set(style, value))
        {
            ++failures;
            std::cerr << "[Style] " << context << ": cannot parse " << key << " value '" << PropToString(value) << "'\n";
        }
    }
    return failures;
}

std::string PropToString(const PropValue& value)
{
    std::ostringstream out;
    std::visit(
        [&out](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, UnitValue>)
            {
                out << v.value << UnitName(v.unit);
            }
            else if constexpr (std::is_same_v<T, glm::vec4>)
            {
                out << "rgba(" << v.r << "," << v.g << "," << v.b << "," << v.a << ")";
            }
            else if constexpr (std::is_same_v<T, bool>)
            {
                out << (v ? "true" : "false");
            }
            else
            {
                out << v;
            }
        },
        value);
    return out.str();
}
} // namespace canopy::ui
