#pragma once

#include <memory>
#include <string>

#include "prism/core/EventBus.hpp"
#include "prism/platform/Window.hpp"
#include "prism/render/CustomProgramRegistry.hpp"
#include "prism/render/ForwardPipeline.hpp"
#include "prism/render/GlDevice.hpp"
#include "prism/render/MaterialLibrary.hpp"
#include "prism/render/RendererSettings.hpp"
#include "prism/scene/OrbitCamera.hpp"
#include "prism/scene/World.hpp"

namespace prism::viewer
{
/// Standalone demo: a default cube, a PBR sphere and a custom-shaded sphere lit
/// by two directional lights, viewed through an orbit camera.
class ViewerApp
{
public:
    ViewerApp() = default;
    ~ViewerApp();

    ViewerApp(const ViewerApp&) = delete;
    ViewerApp& operator=(const ViewerApp&) = delete;

    bool Initialize(const std::string& configPath);
    void Run();

private:
    void BuildScene();
    void RegisterCustomShaders();
    void HandleInput(float deltaSeconds);
    void PrintStats() const;

    platform::Window m_window;
    render::RendererSettings m_settings;
    std::unique_ptr<render::GlDevice> m_device;
    std::unique_ptr<render::CustomProgramRegistry> m_customPrograms;
    std::unique_ptr<render::ForwardPipeline> m_pipeline;
    render::MaterialLibrary m_materials;
    core::EventBus m_eventBus;
    scene::World m_world;
    scene::OrbitCamera m_camera;
};
} // namespace prism::viewer
