#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <variant>

#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>

#include "prism/core/EventBus.hpp"
#include "prism/render/ExternalServices.hpp"
#include "prism/render/GraphicsDevice.hpp"
#include "prism/render/LightPacking.hpp"
#include "prism/render/MeshGpuCache.hpp"
#include "prism/render/RendererSettings.hpp"
#include "prism/render/ShaderProgram.hpp"
#include "prism/scene/SceneInterfaces.hpp"

namespace prism::render
{
constexpr const char* kRendererInitializedEvent = "renderer:initialized";
constexpr const char* kObjectRemovedEvent = "scene:objectRemoved";

struct DefaultProgramKind
{
    bool operator==(const DefaultProgramKind&) const = default;
};

struct PbrProgramKind
{
    bool operator==(const PbrProgramKind&) const = default;
};

struct CustomProgramKind
{
    std::string shaderId;
    bool operator==(const CustomProgramKind&) const = default;
};

using ProgramKind = std::variant<DefaultProgramKind, PbrProgramKind, CustomProgramKind>;

[[nodiscard]] std::string DescribeProgramKind(const ProgramKind& kind);

/// Per-frame counters, reset at the start of every Render().
struct RenderStats
{
    std::uint32_t drawCalls = 0;
    std::uint32_t edgeDrawCalls = 0;
    std::uint32_t programBinds = 0;
    std::uint32_t objectsDrawn = 0;
    std::uint32_t objectsSkipped = 0;
    std::uint32_t meshCacheHits = 0;
    std::uint32_t meshCacheMisses = 0;
    int lightCount = 0;
};

/// Collaborators owned elsewhere. Any of them may be null.
struct PipelineServices
{
    const scene::ILightAggregator* lights = nullptr;
    const IShaderProgramProvider* customPrograms = nullptr;
    const IMaterialAssetRegistry* materials = nullptr;
    core::EventBus* events = nullptr;
};

/// Single-pass forward renderer. Draws every mesh provider in scene order,
/// switching programs only when an object needs a different one.
class ForwardPipeline
{
public:
    ForwardPipeline(IGraphicsDevice& device, RendererSettings settings = {}, PipelineServices services = {});
    ~ForwardPipeline();

    ForwardPipeline(const ForwardPipeline&) = delete;
    ForwardPipeline& operator=(const ForwardPipeline&) = delete;

    /// Compiles the built-in programs and creates the mesh cache. Throws
    /// GraphicsError when a built-in program fails to build.
    void Initialize();
    /// Releases every GPU resource. Later frames are no-ops.
    void Dispose();

    void BeginFrame(const scene::ICamera& camera);
    void Render(const scene::IScene& scene);
    void EndFrame();
    void Resize(int width, int height);

    /// Frees the cached GPU buffers of one entity.
    void DisposeEntity(scene::Entity entity);

    void SetSettings(const RendererSettings& settings) { m_settings = settings; }

    [[nodiscard]] bool IsInitialized() const { return m_initialized; }
    [[nodiscard]] bool IsDisposed() const { return m_disposed; }
    [[nodiscard]] bool HasCamera() const { return m_camera != nullptr; }
    [[nodiscard]] const RendererSettings& Settings() const { return m_settings; }
    [[nodiscard]] const RenderStats& Stats() const { return m_stats; }
    /// std::nullopt while idle.
    [[nodiscard]] const std::optional<ProgramKind>& BoundProgram() const { return m_boundProgram; }
    [[nodiscard]] const PackedLights& FrameLights() const { return m_frame.lights; }
    [[nodiscard]] const MeshGpuCache* MeshCache() const { return m_meshCache.get(); }

private:
    struct ResolvedProgram
    {
        ProgramKind kind;
        const ShaderProgram* program = nullptr;
        const UniformLocationMap* locations = nullptr;
        const MaterialAsset* asset = nullptr;
    };

    struct FrameState
    {
        glm::mat4 viewProjection{1.0F};
        glm::vec3 cameraPosition{0.0F};
        PackedLights lights;
    };

    [[nodiscard]] PackedLights SnapshotLights() const;
    [[nodiscard]] ResolvedProgram ResolveProgram(const scene::MaterialComponent* material) const;
    void BindProgram(const ResolvedProgram& resolved);
    void DrawObject(const scene::IRenderable& renderable);
    void UploadMaterialUniforms(const ResolvedProgram& resolved, const scene::MaterialComponent* material);
    void DrawWireframeOverlay(const std::vector<const scene::IRenderable*>& renderables);
    void ReportObjectFailure(scene::Entity entity, const char* what);
    void OnObjectRemoved(const core::Event& event);

    IGraphicsDevice& m_device;
    RendererSettings m_settings;
    PipelineServices m_services;

    std::unique_ptr<ShaderProgram> m_defaultProgram;
    std::unique_ptr<ShaderProgram> m_pbrProgram;
    std::unique_ptr<ShaderProgram> m_lineProgram;
    std::unique_ptr<MeshGpuCache> m_meshCache;

    const scene::ICamera* m_camera = nullptr;
    std::optional<ProgramKind> m_boundProgram;
    FrameState m_frame;
    RenderStats m_stats;

    bool m_initialized = false;
    bool m_disposed = false;
    std::optional<core::EventBus::SubscriptionId> m_removalSubscription;
    std::unordered_set<scene::Entity> m_reportedFailures;
};
} // namespace prism::render
