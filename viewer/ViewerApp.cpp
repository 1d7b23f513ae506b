#include "viewer/ViewerApp.hpp"

#include <iostream>
#include <utility>

#include <glad/glad.h>
#include <GLFW/glfw3.h>

#include "prism/core/Profiler.hpp"
#include "prism/scene/Primitives.hpp"

namespace prism::viewer
{
namespace
{
constexpr const char* kGlowShaderId = "glow";
constexpr const char* kGlowMaterialId = "glow-material";

constexpr const char* kGlowVertexShader = R"(
#version 450 core
in vec3 aPosition;
in vec3 aNormal;

uniform mat4 uModelMatrix;
uniform mat4 uViewProjectionMatrix;
uniform mat3 uNormalMatrix;

out vec3 vNormal;
out vec3 vWorldPosition;

void main()
{
    vec4 worldPosition = uModelMatrix * vec4(aPosition, 1.0);
    vWorldPosition = worldPosition.xyz;
    vNormal = normalize(uNormalMatrix * aNormal);
    gl_Position = uViewProjectionMatrix * worldPosition;
}
)";

constexpr const char* kGlowFragmentShader = R"(
#version 450 core
in vec3 vNormal;
in vec3 vWorldPosition;

uniform vec3 uCameraPosition;
uniform vec3 uAmbientColor;
uniform vec3 uTint;
uniform float uGlow;

out vec4 FragColor;

void main()
{
    vec3 N = normalize(vNormal);
    vec3 V = normalize(uCameraPosition - vWorldPosition);
    float fresnel = pow(1.0 - max(dot(N, V), 0.0), 2.0);
    vec3 color = uTint * (uAmbientColor + fresnel * uGlow);
    FragColor = vec4(pow(color, vec3(1.0 / 2.2)), 1.0);
}
)";
} // namespace

ViewerApp::~ViewerApp()
{
    // GPU objects must go before the context does.
    m_pipeline.reset();
    m_customPrograms.reset();
    m_device.reset();
    m_window.Close();
}

bool ViewerApp::Initialize(const std::string& configPath)
{
    std::string status;
    if (!LoadRendererSettings(configPath, m_settings, status))
    {
        std::cerr << "[ViewerApp] " << status << "\n";
    }
    else if (!status.empty())
    {
        std::cout << "[ViewerApp] " << status << "\n";
    }

    platform::WindowCallbacks callbacks;
    callbacks.framebufferResized = [this](int width, int height) {
        if (m_pipeline)
        {
            m_pipeline->Resize(width, height);
        }
        m_camera.SetAspect(m_window.AspectRatio());
    };
    callbacks.scrolled = [this](double offset) { m_camera.Zoom(offset > 0.0 ? 0.9F : 1.1F); };
    if (!m_window.Open(platform::WindowSettings{}, std::move(callbacks)))
    {
        return false;
    }

    if (!gladLoadGL(reinterpret_cast<GLADloadfunc>(glfwGetProcAddress)))
    {
        std::cerr << "[ViewerApp] Failed to initialize GLAD.\n";
        return false;
    }

    const unsigned char* glVersion = glGetString(GL_VERSION);
    std::cout << "[ViewerApp] OpenGL version: " << (glVersion != nullptr ? reinterpret_cast<const char*>(glVersion) : "unknown") << "\n";

    m_device = std::make_unique<render::GlDevice>();
    m_customPrograms = std::make_unique<render::CustomProgramRegistry>(*m_device);

    render::PipelineServices services;
    services.lights = &m_world;
    services.customPrograms = m_customPrograms.get();
    services.materials = &m_materials;
    services.events = &m_eventBus;
    m_pipeline = std::make_unique<render::ForwardPipeline>(*m_device, m_settings, services);

    try
    {
        m_pipeline->Initialize();
    }
    catch (const render::GraphicsError& error)
    {
        std::cerr << "[ViewerApp] Renderer setup failed: " << error.what() << "\n";
        return false;
    }

    m_eventBus.Subscribe(render::kRendererInitializedEvent, [](const core::Event& event) {
        std::cout << "[ViewerApp] Renderer '" << (event.args.empty() ? "" : event.args.front()) << "' ready.\n";
    });

    m_pipeline->Resize(m_window.FramebufferWidth(), m_window.FramebufferHeight());
    m_camera.SetAspect(m_window.AspectRatio());

    m_world.SetEventBus(&m_eventBus);
    m_world.SetAmbientColor(m_settings.defaultAmbient);
    RegisterCustomShaders();
    BuildScene();
    return true;
}

void ViewerApp::RegisterCustomShaders()
{
    render::UniformDeclaration glow;
    glow.name = "uGlow";
    glow.type = render::UniformType::Float;
    glow.defaultValue = 1.5F;
    glow.displayName = "Glow";

    render::UniformDeclaration tint;
    tint.name = "uTint";
    tint.type = render::UniformType::Vec3;
    tint.defaultValue = glm::vec3{0.3F, 0.8F, 1.0F};
    tint.displayName = "Tint";

    std::string error;
    if (!m_customPrograms->Compile(kGlowShaderId, kGlowVertexShader, kGlowFragmentShader, {glow, tint}, &error))
    {
        std::cerr << "[ViewerApp] Glow shader unavailable, material falls back to default: " << error << "\n";
    }

    render::MaterialAsset material;
    material.shaderId = kGlowShaderId;
    material.uniforms = {glow, tint};
    material.parameters["uTint"] = glm::vec3{1.0F, 0.45F, 0.2F};
    m_materials.Add(kGlowMaterialId, std::move(material));
}

void ViewerApp::BuildScene()
{
    const scene::Entity cube = m_world.CreateEntity();
    m_world.Names()[cube].name = "Cube";
    m_world.Transforms()[cube].position = glm::vec3{-1.6F, 0.0F, 0.5F};
    m_world.Transforms()[cube].rotationEuler = glm::vec3{0.0F, 0.0F, 30.0F};
    m_world.Meshes()[cube] = scene::MeshComponent{scene::CreateCubeMesh(1.0F), scene::CreateCubeEdges(1.0F)};
    m_world.Materials()[cube].color = glm::vec3{0.8F, 0.3F, 0.25F};

    const scene::Entity metalSphere = m_world.CreateEntity();
    m_world.Names()[metalSphere].name = "Metal Sphere";
    m_world.Transforms()[metalSphere].position = glm::vec3{0.0F, 0.0F, 0.6F};
    m_world.Meshes()[metalSphere] = scene::MeshComponent{scene::CreateUvSphereMesh(0.6F), scene::CreateUvSphereEdges(0.6F, 16, 8)};
    scene::MaterialComponent& metal = m_world.Materials()[metalSphere];
    metal.shaderName = "pbr";
    metal.color = glm::vec3{0.95F, 0.75F, 0.35F};
    metal.metallic = 1.0F;
    metal.roughness = 0.2F;

    const scene::Entity glowSphere = m_world.CreateEntity();
    m_world.Names()[glowSphere].name = "Glow Sphere";
    m_world.Transforms()[glowSphere].position = glm::vec3{1.6F, 0.0F, 0.5F};
    m_world.Meshes()[glowSphere] = scene::MeshComponent{scene::CreateUvSphereMesh(0.5F), std::nullopt};
    m_world.Materials()[glowSphere].materialAssetId = kGlowMaterialId;

    const scene::Entity ground = m_world.CreateEntity();
    m_world.Names()[ground].name = "Ground";
    m_world.Transforms()[ground].position = glm::vec3{0.0F, 0.0F, -0.05F};
    m_world.Transforms()[ground].scale = glm::vec3{8.0F, 8.0F, 0.1F};
    m_world.Meshes()[ground] = scene::MeshComponent{scene::CreateCubeMesh(1.0F), std::nullopt};
    m_world.Materials()[ground].color = glm::vec3{0.5F, 0.5F, 0.55F};

    const scene::Entity sun = m_world.CreateEntity();
    m_world.Names()[sun].name = "Sun";
    m_world.Lights()[sun] = scene::LightData{{-0.4F, -0.6F, -1.0F}, {1.0F, 0.95F, 0.9F}, true};

    const scene::Entity fill = m_world.CreateEntity();
    m_world.Names()[fill].name = "Fill";
    m_world.Lights()[fill] = scene::LightData{{0.7F, 0.5F, -0.3F}, {0.25F, 0.3F, 0.45F}, true};

    std::cout << "[ViewerApp] Scene ready with " << m_world.Entities().size() << " entities.\n";
}

void ViewerApp::HandleInput(float deltaSeconds)
{
    if (m_window.KeyDown(GLFW_KEY_ESCAPE))
    {
        m_window.RequestClose();
    }

    const platform::DragDelta& drag = m_window.Drag();
    if (drag.active)
    {
        m_camera.Orbit(static_cast<float>(-drag.dx) * 0.3F, static_cast<float>(drag.dy) * 0.3F);
    }
    else
    {
        m_camera.Orbit(8.0F * deltaSeconds, 0.0F);
    }

    if (m_window.KeyPressed(GLFW_KEY_W))
    {
        m_settings.wireframeOverlay = !m_settings.wireframeOverlay;
        m_pipeline->SetSettings(m_settings);
    }

    // Delete removes the most recently created mesh entity.
    if (m_window.KeyPressed(GLFW_KEY_DELETE))
    {
        const std::vector<scene::Entity> entities = m_world.Entities();
        for (auto it = entities.rbegin(); it != entities.rend(); ++it)
        {
            if (m_world.Meshes().contains(*it))
            {
                m_world.DestroyEntity(*it);
                break;
            }
        }
    }
}

void ViewerApp::Run()
{
    double lastTime = m_window.TimeSeconds();
    double lastReport = lastTime;

    while (!m_window.ShouldClose())
    {
        core::Profiler::Instance().BeginFrame();

        const double now = m_window.TimeSeconds();
        const auto deltaSeconds = static_cast<float>(now - lastTime);
        lastTime = now;

        m_window.PollInput();
        HandleInput(deltaSeconds);
        m_eventBus.DispatchQueued();

        m_pipeline->BeginFrame(m_camera);
        m_pipeline->Render(m_world);
        m_pipeline->EndFrame();

        {
            PROFILE_SCOPE("Swap");
            m_window.Present();
        }
        core::Profiler::Instance().EndFrame();

        if (now - lastReport >= 2.0)
        {
            lastReport = now;
            PrintStats();
        }
    }
}

void ViewerApp::PrintStats() const
{
    const core::FrameStats& frame = core::Profiler::Instance().Stats();
    const render::RenderStats& render = m_pipeline->Stats();
    std::cout << "[ViewerApp] " << frame.avgFps << " fps, " << render.drawCalls << " draws, " << render.edgeDrawCalls
              << " edge draws, " << render.programBinds << " binds, " << render.lightCount << " lights, "
              << m_pipeline->MeshCache()->SolidCount() << " cached meshes\n";
}
} // namespace prism::viewer
