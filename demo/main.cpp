#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>

#include <glad/glad.h>
#include <GLFW/glfw3.h>

#include <glm/ext/matrix_clip_space.hpp>
#include <glm/ext/matrix_transform.hpp>
#include <glm/mat4x4.hpp>
#include <glm/trigonometric.hpp>

#include "canopy/core/Config.hpp"
#include "canopy/core/EventBus.hpp"
#include "canopy/core/WorkerPool.hpp"
#include "canopy/gpu/GlGpu.hpp"
#include "canopy/platform/Window.hpp"
#include "canopy/scene/Mesh.hpp"
#include "canopy/scene/Scene.hpp"
#include "canopy/ui/GlRenderSurface.hpp"
#include "canopy/ui/StyleSheet.hpp"
#include "canopy/ui/WidgetTree.hpp"
#include "canopy/ui/Widgets.hpp"

namespace
{
using namespace canopy;

// Plane whose vertices ripple every frame. The vertex count never changes,
// so only positions are rewritten and re-uploaded.
class WaveMesh final : public scene::PlaneMesh
{
public:
    explicit WaveMesh(const scene::PlaneParams& params) : PlaneMesh("wave", params)
    {
        (void)SetDynamic(true);
    }

    void Update(scene::Scene& scene) override
    {
        m_phase += 0.03F;
        if (!SetPlaneVtx(0, m_params))
        {
            return;
        }
        const int cols = m_params.wsegs + 1;
        for (std::size_t v = 0; v < VertexCount(); ++v)
        {
            const float ix = static_cast<float>(static_cast<int>(v) % cols);
            const float iy = static_cast<float>(static_cast<int>(v) / cols);
            vertices[v * 3 + 1] = 0.15F * std::sin(m_phase + ix * 0.4F) * std::cos(m_phase * 0.7F + iy * 0.3F);
        }
        SetVtxData(scene);
        TransferVectors();
    }

private:
    float m_phase = 0.0F;
};

std::unique_ptr<ui::WidgetNode> BuildPanel(int& clicks)
{
    auto root = ui::NewLayout("root", ui::LayoutDir::Horiz);

    auto panel = ui::NewFrame("panel", ui::LayoutDir::Vert);
    panel->SetMinPrefWidth(ui::UnitValue::Em(16.0F));
    panel->SetStretchMaxHeight();
    panel->AddChild(ui::NewLabel("title", "canopy"));
    panel->AddChild(ui::NewLabel("status", "0 clicks"));

    auto button = ui::NewButton("count", "Count", "plus");
    button->tooltip = "Increments the click counter";
    button->signals.Connect(ui::WidgetSignal::Clicked, [&clicks](ui::WidgetNode& node, ui::WidgetSignal) {
        ++clicks;
        if (node.tree == nullptr)
        {
            return;
        }
        if (ui::WidgetNode* status = node.tree->FindByName("status"))
        {
            ui::SetLabelText(*status, std::to_string(clicks) + (clicks == 1 ? " click" : " clicks"));
        }
    });
    panel->AddChild(std::move(button));

    auto toggle = ui::NewButton("toggle", "Select me");
    toggle->tooltip = "Toggles its selected state";
    panel->AddChild(std::move(toggle));

    auto disabled = ui::NewButton("disabled", "Inactive");
    disabled->SetInactive(true);
    panel->AddChild(std::move(disabled));

    auto filler = ui::NewSpace("filler");
    filler->SetStretchMaxHeight();
    panel->AddChild(std::move(filler));

    root->AddChild(std::move(panel));
    return root;
}

// Every GL object is created and destroyed inside this scope, while the
// window still owns a current context.
int Run(const core::ToolkitConfig& config, platform::Window& window, core::EventBus& bus)
{
    std::string error;
    gpu::GlGpu gpu;
    scene::Scene scene(gpu, config);
    if (!scene.Init(&error))
    {
        std::cerr << "Failed to initialize scene: " << error << "\n";
        return 1;
    }

    scene::PlaneParams floor;
    floor.waxis = scene::Axis::X;
    floor.haxis = scene::Axis::Z;
    floor.width = 4.0F;
    floor.height = 4.0F;
    floor.woff = -2.0F;
    floor.hoff = -2.0F;
    floor.wsegs = 48;
    floor.hsegs = 48;
    scene.AddMesh(std::make_unique<WaveMesh>(floor));
    scene.AddObject("wave", "wave").color = glm::vec4{0.35F, 0.6F, 0.85F, 1.0F};

    core::WorkerPool workers;
    workers.Initialize(static_cast<std::size_t>(std::max(config.meshWorkers, 0)));
    scene.BuildMeshes(&workers);

    ui::GlRenderSurface surface;
    if (!surface.Initialize(config.fontPath, &error))
    {
        std::cerr << "Failed to initialize UI surface: " << error << "\n";
        workers.Shutdown();
        return 1;
    }

    int clicks = 0;
    ui::WidgetTree tree(config);
    if (!tree.LoadTypeProps(config.typePropsPath, &error))
    {
        std::cerr << "Warning: using built-in widget defaults (" << error << ")\n";
    }
    if (!config.styleSheetPath.empty())
    {
        auto sheet = std::make_shared<ui::StyleSheet>();
        if (ui::LoadStyleSheet(config.styleSheetPath, *sheet, &error))
        {
            tree.SetStyleSheet(std::move(sheet));
        }
        else
        {
            std::cerr << "Warning: style sheet not applied (" << error << ")\n";
        }
    }
    surface.BeginFrame(window.FramebufferSize());
    tree.SetSurface(&surface);
    tree.SetRoot(BuildPanel(clicks));
    tree.Subscribe(bus);

    while (!window.ShouldClose())
    {
        window.PollEvents();
        bus.DispatchQueued();

        const glm::ivec2 fb = window.FramebufferSize();
        glViewport(0, 0, fb.x, fb.y);
        glClearColor(0.08F, 0.09F, 0.11F, 1.0F);
        glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
        glEnable(GL_DEPTH_TEST);

        const float aspect = fb.y > 0 ? static_cast<float>(fb.x) / static_cast<float>(fb.y) : 1.0F;
        const glm::mat4 projection = glm::perspective(glm::radians(50.0F), aspect, 0.1F, 100.0F);
        const glm::mat4 view = glm::lookAt(glm::vec3{0.0F, 2.5F, 4.5F}, glm::vec3{0.0F}, glm::vec3{0.0F, 1.0F, 0.0F});
        scene.UpdateMeshes();
        scene.Render(projection * view);

        glDisable(GL_DEPTH_TEST);
        surface.BeginFrame(fb);
        tree.Render();
        surface.EndFrame();

        window.SwapBuffers();
    }

    workers.Shutdown();
    surface.Shutdown();
    return 0;
}
} // namespace

int main(int argc, char** argv)
{
    core::ToolkitConfig config;
    const std::string configPath = argc > 1 ? argv[1] : "assets/config.json";
    std::string error;
    if (!core::LoadToolkitConfig(configPath, config, &error))
    {
        std::cerr << "Failed to load config: " << error << "\n";
        return 1;
    }

    core::EventBus bus;
    platform::Window window;
    if (!window.Initialize(config.window, &bus))
    {
        return 1;
    }

    if (!gladLoadGL(reinterpret_cast<GLADloadfunc>(glfwGetProcAddress)))
    {
        std::cerr << "Failed to initialize GLAD.\n";
        window.Shutdown();
        return 1;
    }
    const unsigned char* glVersion = glGetString(GL_VERSION);
    std::cout << "OpenGL version: " << (glVersion != nullptr ? reinterpret_cast<const char*>(glVersion) : "unknown") << "\n";

    const int result = Run(config, window, bus);
    window.Shutdown();
    return result;
}
