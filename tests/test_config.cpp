#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <string>

#include "canopy/core/Config.hpp"
#include "canopy/ui/Color.hpp"
#include "canopy/ui/RecordingSurface.hpp"
#include "canopy/ui/StyleContext.hpp"
#include "canopy/ui/WidgetTree.hpp"
#include "canopy/ui/Widgets.hpp"

using namespace canopy;

namespace
{
// Writes `content` to a file in the temp directory and removes it on scope exit.
class TempFile
{
public:
    TempFile(const std::string& name, const std::string& content)
        : m_path(std::filesystem::temp_directory_path() / name)
    {
        std::ofstream out(m_path);
        out << content;
    }

    ~TempFile()
    {
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
    }

    [[nodiscard]] std::string Path() const { return m_path.string(); }

private:
    std::filesystem::path m_path;
};
} // namespace

TEST_CASE("Toolkit config loading", "[Config]")
{
    core::ToolkitConfig config;
    std::string error;

    SECTION("Keys present in the file override defaults")
    {
        TempFile file("canopy_config_test.json", R"({
            "window": { "width": 640, "title": "test" },
            "units": { "dots_per_px": 2.0 },
            "trace": { "layout": true },
            "rebuild_default_styles": true,
            "type_props_path": "types.json",
            "mesh_workers": 3
        })");
        REQUIRE(core::LoadToolkitConfig(file.Path(), config, &error));
        REQUIRE(config.window.width == 640);
        REQUIRE(config.window.height == 800);
        REQUIRE(config.window.title == "test");
        REQUIRE(config.units.dotsPerPx == Approx(2.0F));
        REQUIRE(config.units.fontSizePx == Approx(16.0F));
        REQUIRE(config.trace.layout);
        REQUIRE_FALSE(config.trace.style);
        REQUIRE(config.rebuildDefaultStyles);
        REQUIRE(config.typePropsPath == "types.json");
        REQUIRE(config.meshWorkers == 3);
    }

    SECTION("A missing file keeps the defaults")
    {
        REQUIRE(core::LoadToolkitConfig("/nonexistent/canopy.json", config, &error));
        REQUIRE(config.window.width == 1280);
        REQUIRE(config.typePropsPath == "assets/types.json");
    }

    SECTION("Malformed JSON is an error naming the file")
    {
        TempFile file("canopy_config_bad.json", "{ \"window\": ");
        REQUIRE_FALSE(core::LoadToolkitConfig(file.Path(), config, &error));
        REQUIRE(error.rfind(file.Path(), 0) == 0);
    }

    SECTION("Wrongly typed values are an error")
    {
        TempFile file("canopy_config_type.json", R"({ "mesh_workers": "many" })");
        REQUIRE_FALSE(core::LoadToolkitConfig(file.Path(), config, &error));
        REQUIRE(config.meshWorkers == 0);
    }
}

TEST_CASE("Type metadata files", "[Config][Style]")
{
    core::ToolkitConfig config;
    std::string error;

    SECTION("Registry merges selector sub-maps over built-ins")
    {
        ui::TypeRegistry types;
        ui::RegisterBuiltinTypes(types);
        REQUIRE(types.LoadFromJson(R"({
            "types": {
                "Button": { "padding": "6px", ":hover": { "background-color": "#ffffff" } },
                "Gauge": { "width": "4em", "#needle": { "fill": "red" } }
            }
        })",
            &error));
        REQUIRE(types.HasType("Gauge"));
        REQUIRE(types.SelectorProps("Gauge", "#needle") != nullptr);
        REQUIRE(types.SelectorProps("Button", ":hover") != nullptr);
        REQUIRE(types.SelectorProps("Button", "#icon") != nullptr);
        REQUIRE(types.SelectorProps("Gauge", "padding") == nullptr);
        REQUIRE(types.BaseProps("Gauge")->count("#needle") == 0);
    }

    SECTION("Missing types object is rejected")
    {
        ui::TypeRegistry types;
        REQUIRE_FALSE(types.LoadFromJson(R"({"Button": {}})", &error));
        REQUIRE(error == "missing types object");
        REQUIRE_FALSE(types.LoadFromJson("[", &error));
    }

    SECTION("A loaded file restyles the tree on its next render")
    {
        ui::RecordingSurface surface{glm::ivec2{200, 100}};
        ui::WidgetTree tree(config);
        tree.SetSurface(&surface);
        ui::WidgetNode* label = tree.SetRoot(ui::NewLabel("label", "Styled"));
        tree.Render();
        REQUIRE(label->style.padding.dots == Approx(2.0F));

        TempFile file("canopy_types_test.json", R"({"types": {"Label": {"padding": "5px", "color": "#0000ff"}}})");
        REQUIRE(tree.LoadTypeProps(file.Path(), &error));
        tree.Render();
        REQUIRE(label->style.padding.dots == Approx(5.0F));
        REQUIRE(label->style.color == *ui::ParseColor("#0000ff"));
    }

    SECTION("Unreadable files report an error")
    {
        ui::WidgetTree tree(config);
        REQUIRE_FALSE(tree.LoadTypeProps("/nonexistent/types.json", &error));
        REQUIRE(error == "cannot open /nonexistent/types.json");
    }
}
