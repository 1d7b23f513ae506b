#include "prism/render/ForwardPipeline.hpp"

#include <iostream>
#include <limits>
#include <stdexcept>
#include <utility>

#include "prism/core/Profiler.hpp"
#include "prism/render/BuiltinPrograms.hpp"
#include "prism/render/TransformMath.hpp"

namespace prism::render
{
namespace
{
template <typename T>
void UploadIfPresent(IGraphicsDevice& device, const UniformLocationMap& locations, const char* name, const T& value)
{
    const auto it = locations.find(name);
    if (it != locations.end() && it->second >= 0)
    {
        device.SetUniform(it->second, value);
    }
}

void UploadArrayIfPresent(IGraphicsDevice& device, const UniformLocationMap& locations, const char* name,
                          const std::array<glm::vec3, kMaxLights>& values)
{
    const auto it = locations.find(name);
    if (it != locations.end() && it->second >= 0)
    {
        device.SetUniformArray(it->second, values.data(), kMaxLights);
    }
}
} // namespace

std::string DescribeProgramKind(const ProgramKind& kind)
{
    if (std::holds_alternative<DefaultProgramKind>(kind))
    {
        return "default";
    }
    if (std::holds_alternative<PbrProgramKind>(kind))
    {
        return "pbr";
    }
    return "custom:" + std::get<CustomProgramKind>(kind).shaderId;
}

ForwardPipeline::ForwardPipeline(IGraphicsDevice& device, RendererSettings settings, PipelineServices services)
    : m_device(device)
    , m_settings(std::move(settings))
    , m_services(services)
{
}

ForwardPipeline::~ForwardPipeline()
{
    Dispose();
}

void ForwardPipeline::Initialize()
{
    if (m_initialized)
    {
        return;
    }

    // Build into locals so a failure leaves the pipeline untouched.
    std::unique_ptr<ShaderProgram> defaultProgram = CreateBuiltinProgram(m_device, BuiltinProgram::Default);
    std::unique_ptr<ShaderProgram> pbrProgram = CreateBuiltinProgram(m_device, BuiltinProgram::Pbr);
    std::unique_ptr<ShaderProgram> lineProgram = CreateBuiltinProgram(m_device, BuiltinProgram::Line);
    defaultProgram->Compile();
    pbrProgram->Compile();
    lineProgram->Compile();

    m_defaultProgram = std::move(defaultProgram);
    m_pbrProgram = std::move(pbrProgram);
    m_lineProgram = std::move(lineProgram);
    m_meshCache = std::make_unique<MeshGpuCache>(m_device);
    m_initialized = true;
    m_disposed = false;

    if (m_services.events != nullptr)
    {
        m_removalSubscription = m_services.events->Subscribe(kObjectRemovedEvent, [this](const core::Event& event) { OnObjectRemoved(event); });
        m_services.events->Publish(core::Event{kRendererInitializedEvent, {"forward"}});
    }

    std::cout << "[ForwardPipeline] Initialized (default, pbr, line programs ready).\n";
}

void ForwardPipeline::Dispose()
{
    if (m_disposed)
    {
        return;
    }

    if (m_removalSubscription.has_value() && m_services.events != nullptr)
    {
        m_services.events->Unsubscribe(*m_removalSubscription);
    }
    m_removalSubscription.reset();

    if (m_meshCache != nullptr)
    {
        m_meshCache->DisposeAll();
        m_meshCache.reset();
    }
    m_defaultProgram.reset();
    m_pbrProgram.reset();
    m_lineProgram.reset();

    m_camera = nullptr;
    m_boundProgram.reset();
    m_reportedFailures.clear();
    m_initialized = false;
    m_disposed = true;
}

void ForwardPipeline::BeginFrame(const scene::ICamera& camera)
{
    if (!m_initialized || m_disposed)
    {
        return;
    }

    m_camera = &camera;
    m_device.SetDepthTest(true);
    m_device.SetBackFaceCulling(true);
    m_device.Clear(m_settings.clearColor);
}

void ForwardPipeline::Render(const scene::IScene& scene)
{
    if (!m_initialized || m_disposed || m_camera == nullptr)
    {
        return;
    }

    PROFILE_SCOPE("Render");
    m_stats = RenderStats{};

    m_frame.viewProjection = m_camera->GetViewProjectionMatrix();
    m_frame.cameraPosition = m_camera->Position();
    m_frame.lights = SnapshotLights();
    m_stats.lightCount = m_frame.lights.count;

    m_boundProgram.reset();
    BindProgram(ResolvedProgram{DefaultProgramKind{}, m_defaultProgram.get(), &m_defaultProgram->Uniforms(), nullptr});

    const std::vector<const scene::IRenderable*> renderables = scene.GetRenderables();
    for (const scene::IRenderable* renderable : renderables)
    {
        if (renderable == nullptr)
        {
            continue;
        }
        try
        {
            DrawObject(*renderable);
        }
        catch (const std::exception& error)
        {
            m_device.BindVertexArray(kNullHandle);
            ReportObjectFailure(renderable->Id(), error.what());
        }
    }

    if (m_settings.wireframeOverlay)
    {
        DrawWireframeOverlay(renderables);
    }
}

void ForwardPipeline::EndFrame()
{
    m_camera = nullptr;
}

void ForwardPipeline::Resize(int width, int height)
{
    if (m_disposed)
    {
        return;
    }
    m_device.SetViewport(0, 0, width, height);
}

void ForwardPipeline::DisposeEntity(scene::Entity entity)
{
    if (m_meshCache != nullptr)
    {
        m_meshCache->Dispose(entity);
    }
    m_reportedFailures.erase(entity);
}

PackedLights ForwardPipeline::SnapshotLights() const
{
    LightPackingOptions options;
    options.useFallbackLight = m_settings.useFallbackLight;
    options.fallbackDirection = m_settings.fallbackLightDirection;
    options.fallbackColor = m_settings.fallbackLightColor;

    if (m_services.lights == nullptr)
    {
        return PackLights({}, m_settings.defaultAmbient, options);
    }
    return PackLights(m_services.lights->ActiveLights(), m_services.lights->AmbientColor(), options);
}

ForwardPipeline::ResolvedProgram ForwardPipeline::ResolveProgram(const scene::MaterialComponent* material) const
{
    if (material != nullptr && material->materialAssetId.has_value() && m_services.materials != nullptr &&
        m_services.customPrograms != nullptr)
    {
        const MaterialAsset* asset = m_services.materials->FindMaterial(*material->materialAssetId);
        if (asset != nullptr)
        {
            const ShaderProgram* program = m_services.customPrograms->FindProgram(asset->shaderId);
            if (program != nullptr)
            {
                return ResolvedProgram{CustomProgramKind{asset->shaderId}, program,
                                       m_services.customPrograms->FindUniformLocations(asset->shaderId), asset};
            }
        }
    }

    if (material != nullptr && material->shaderName == "pbr" && m_pbrProgram != nullptr && m_pbrProgram->IsReady())
    {
        return ResolvedProgram{PbrProgramKind{}, m_pbrProgram.get(), &m_pbrProgram->Uniforms(), nullptr};
    }

    return ResolvedProgram{DefaultProgramKind{}, m_defaultProgram.get(), &m_defaultProgram->Uniforms(), nullptr};
}

void ForwardPipeline::BindProgram(const ResolvedProgram& resolved)
{
    resolved.program->Use();
    m_boundProgram = resolved.kind;
    ++m_stats.programBinds;
    core::Profiler::Instance().RecordProgramBind();

    if (resolved.locations == nullptr)
    {
        return;
    }

    const UniformLocationMap& locations = *resolved.locations;
    UploadIfPresent(m_device, locations, uniforms::kViewProjectionMatrix, m_frame.viewProjection);
    UploadIfPresent(m_device, locations, uniforms::kCameraPosition, m_frame.cameraPosition);
    UploadArrayIfPresent(m_device, locations, uniforms::kLightDirections, m_frame.lights.directions);
    UploadArrayIfPresent(m_device, locations, uniforms::kLightColors, m_frame.lights.colors);
    UploadIfPresent(m_device, locations, uniforms::kLightCount, m_frame.lights.count);
    UploadIfPresent(m_device, locations, uniforms::kAmbientColor, m_frame.lights.ambient);
}

void ForwardPipeline::DrawObject(const scene::IRenderable& renderable)
{
    const scene::IMeshProvider* provider = renderable.AsMeshProvider();
    if (provider == nullptr)
    {
        return;
    }
    const scene::MeshData* mesh = provider->GetMeshData();
    if (mesh == nullptr)
    {
        ++m_stats.objectsSkipped;
        core::Profiler::Instance().RecordSkippedObject();
        return;
    }

    const scene::MaterialComponent* material = renderable.GetMaterial();
    const ResolvedProgram resolved = ResolveProgram(material);
    if (resolved.locations == nullptr)
    {
        throw GraphicsError("no uniform locations for program " + DescribeProgramKind(resolved.kind));
    }
    if (!m_boundProgram.has_value() || *m_boundProgram != resolved.kind)
    {
        BindProgram(resolved);
    }

    const glm::mat4 model = ComputeModelMatrix(renderable.GetTransform());
    const glm::mat3 normal = ComputeNormalMatrix(model);

    const bool cached = m_meshCache->HasSolid(renderable.Id());
    const GpuMeshResources& gpu = m_meshCache->GetOrCreateSolid(renderable.Id(), *mesh, *resolved.program);
    if (cached)
    {
        ++m_stats.meshCacheHits;
    }
    else
    {
        ++m_stats.meshCacheMisses;
    }
    core::Profiler::Instance().RecordCacheLookup(cached);

    UploadIfPresent(m_device, *resolved.locations, uniforms::kModelMatrix, model);
    UploadIfPresent(m_device, *resolved.locations, uniforms::kNormalMatrix, normal);
    UploadMaterialUniforms(resolved, material);

    if (gpu.indexCount <= 0)
    {
        ++m_stats.objectsSkipped;
        core::Profiler::Instance().RecordSkippedObject();
        return;
    }

    m_device.BindVertexArray(gpu.vao);
    m_device.DrawIndexed(PrimitiveMode::Triangles, gpu.indexCount);
    m_device.BindVertexArray(kNullHandle);

    ++m_stats.drawCalls;
    ++m_stats.objectsDrawn;
    core::Profiler::Instance().RecordDrawCall(static_cast<std::uint32_t>(mesh->VertexCount()),
                                              static_cast<std::uint32_t>(gpu.indexCount / 3));
}

void ForwardPipeline::UploadMaterialUniforms(const ResolvedProgram& resolved, const scene::MaterialComponent* material)
{
    const UniformLocationMap& locations = *resolved.locations;
    const glm::vec3 baseColor = (material != nullptr && material->color.has_value()) ? *material->color : m_settings.defaultBaseColor;

    if (std::holds_alternative<DefaultProgramKind>(resolved.kind))
    {
        UploadIfPresent(m_device, locations, uniforms::kBaseColor, baseColor);
        return;
    }

    if (std::holds_alternative<PbrProgramKind>(resolved.kind))
    {
        const scene::MaterialComponent defaults;
        const scene::MaterialComponent& source = material != nullptr ? *material : defaults;
        UploadIfPresent(m_device, locations, uniforms::kBaseColor, baseColor);
        UploadIfPresent(m_device, locations, uniforms::kMetallic, source.metallic.value_or(0.0F));
        UploadIfPresent(m_device, locations, uniforms::kRoughness, source.roughness.value_or(0.5F));
        UploadIfPresent(m_device, locations, uniforms::kEmission, source.emission.value_or(glm::vec3{0.0F}));
        UploadIfPresent(m_device, locations, uniforms::kEmissionStrength, source.emissionStrength.value_or(0.0F));
        return;
    }

    if (resolved.asset == nullptr)
    {
        return;
    }

    for (const UniformDeclaration& declaration : resolved.asset->uniforms)
    {
        const auto locationIt = locations.find(declaration.name);
        if (locationIt == locations.end())
        {
            continue;
        }

        // Parameter value first; the declared default covers missing or mistyped parameters.
        const auto parameterIt = resolved.asset->parameters.find(declaration.name);
        if (parameterIt != resolved.asset->parameters.end() &&
            UploadUniform(m_device, locationIt->second, declaration.type, parameterIt->second))
        {
            continue;
        }
        // Unsupported types (sampler2D, unknown) upload nothing.
        (void)UploadUniform(m_device, locationIt->second, declaration.type, declaration.defaultValue);
    }
}

void ForwardPipeline::DrawWireframeOverlay(const std::vector<const scene::IRenderable*>& renderables)
{
    m_lineProgram->Use();
    m_boundProgram.reset();
    ++m_stats.programBinds;
    core::Profiler::Instance().RecordProgramBind();
    m_lineProgram->SetVec3(uniforms::kColor, m_settings.wireframeColor);

    for (const scene::IRenderable* renderable : renderables)
    {
        if (renderable == nullptr || renderable->AsMeshProvider() == nullptr)
        {
            continue;
        }
        const scene::EdgeData* edges = renderable->AsMeshProvider()->GetEdgeData();
        if (edges == nullptr || edges->lineCount == 0)
        {
            continue;
        }

        try
        {
            const EdgeGpuResources& gpu = m_meshCache->GetOrCreateEdges(renderable->Id(), *edges, *m_lineProgram);
            const glm::mat4 mvp = m_frame.viewProjection * ComputeModelMatrix(renderable->GetTransform());
            m_lineProgram->SetMat4(uniforms::kModelViewProjection, mvp);

            m_device.BindVertexArray(gpu.vao);
            m_device.DrawArrays(PrimitiveMode::Lines, 0, gpu.vertexCount);
            m_device.BindVertexArray(kNullHandle);
            ++m_stats.edgeDrawCalls;
            core::Profiler::Instance().RecordDrawCall(static_cast<std::uint32_t>(gpu.vertexCount));
        }
        catch (const std::exception& error)
        {
            m_device.BindVertexArray(kNullHandle);
            ReportObjectFailure(renderable->Id(), error.what());
        }
    }
}

void ForwardPipeline::ReportObjectFailure(scene::Entity entity, const char* what)
{
    ++m_stats.objectsSkipped;
    core::Profiler::Instance().RecordSkippedObject();
    if (m_reportedFailures.insert(entity).second)
    {
        std::cerr << "[ForwardPipeline] Skipping entity " << entity << ": " << what << "\n";
    }
}

void ForwardPipeline::OnObjectRemoved(const core::Event& event)
{
    if (event.args.empty())
    {
        return;
    }

    try
    {
        const unsigned long id = std::stoul(event.args.front());
        if (id > std::numeric_limits<scene::Entity>::max())
        {
            throw std::out_of_range("entity id exceeds 32 bits");
        }
        DisposeEntity(static_cast<scene::Entity>(id));
    }
    catch (const std::logic_error&)
    {
        std::cerr << "[ForwardPipeline] Ignoring " << kObjectRemovedEvent << " with bad entity id '" << event.args.front() << "'\n";
    }
}
} // namespace prism::render
