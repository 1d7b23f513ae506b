#pragma once

#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "prism/render/GraphicsDevice.hpp"
#include "prism/render/UniformValue.hpp"

namespace prism::tests
{
/// Recording IGraphicsDevice for tests. Uniform and attribute locations are
/// derived from the GLSL declarations, so programs behave like real ones
/// without a context.
class FakeGraphicsDevice final : public render::IGraphicsDevice
{
public:
    struct DrawRecord
    {
        render::PrimitiveMode mode = render::PrimitiveMode::Triangles;
        int count = 0;
        render::GpuHandle vertexArray = render::kNullHandle;
        render::GpuHandle program = render::kNullHandle;
    };

    struct AttributeRecord
    {
        render::GpuHandle vertexArray = render::kNullHandle;
        render::GpuHandle buffer = render::kNullHandle;
        int location = -1;
        int components = 0;
    };

    // Failure injection.
    bool failVertexArrays = false;
    bool failBuffers = false;
    bool throwFromBuffers = false;     // CreateBuffer throws std::runtime_error
    std::string failCompileContaining; // compile fails when the source contains this text
    std::string failLinkContaining;    // link fails when either stage contains this text

    render::ShaderBuildResult CompileShader(render::ShaderStage stage, const std::string& source) override;
    render::ShaderBuildResult LinkProgram(render::GpuHandle vertexShader, render::GpuHandle fragmentShader) override;
    void DeleteShader(render::GpuHandle shader) override;
    void DeleteProgram(render::GpuHandle program) override;
    void UseProgram(render::GpuHandle program) override;

    [[nodiscard]] std::vector<std::string> ListActiveUniforms(render::GpuHandle program) override;
    [[nodiscard]] int GetUniformLocation(render::GpuHandle program, const std::string& name) override;
    [[nodiscard]] int GetAttribLocation(render::GpuHandle program, const std::string& name) override;

    [[nodiscard]] render::GpuHandle CreateVertexArray() override;
    [[nodiscard]] render::GpuHandle CreateBuffer() override;
    void BindVertexArray(render::GpuHandle vertexArray) override;
    void UploadBuffer(render::BufferTarget target, render::GpuHandle buffer, const void* data, std::size_t sizeBytes) override;
    void SetVertexAttribute(int location, int components) override;
    void DeleteVertexArray(render::GpuHandle vertexArray) override;
    void DeleteBuffer(render::GpuHandle buffer) override;

    void SetUniform(int location, float value) override { RecordUniform(location, value); }
    void SetUniform(int location, int value) override { RecordUniform(location, value); }
    void SetUniform(int location, const glm::vec2& value) override { RecordUniform(location, value); }
    void SetUniform(int location, const glm::vec3& value) override { RecordUniform(location, value); }
    void SetUniform(int location, const glm::vec4& value) override { RecordUniform(location, value); }
    void SetUniform(int location, const glm::mat3& value) override { RecordUniform(location, value); }
    void SetUniform(int location, const glm::mat4& value) override { RecordUniform(location, value); }
    void SetUniformArray(int location, const glm::vec3* values, int count) override;

    void DrawIndexed(render::PrimitiveMode mode, int indexCount) override;
    void DrawArrays(render::PrimitiveMode mode, int first, int vertexCount) override;
    void SetDepthTest(bool enabled) override { depthTestEnabled = enabled; }
    void SetBackFaceCulling(bool enabled) override { backFaceCullingEnabled = enabled; }
    void Clear(const glm::vec4& color) override;
    void SetViewport(int x, int y, int width, int height) override;

    /// Most recent value uploaded to |name| on |program|; nullptr if never set.
    [[nodiscard]] const render::UniformValue* Uniform(render::GpuHandle program, const std::string& name) const;
    [[nodiscard]] const std::vector<glm::vec3>* UniformArray(render::GpuHandle program, const std::string& name) const;
    [[nodiscard]] int UniformWriteCount(const std::string& name) const;
    [[nodiscard]] std::size_t LiveVertexArrays() const { return m_liveVertexArrays.size(); }
    [[nodiscard]] std::size_t LiveBuffers() const { return m_liveBuffers.size(); }
    [[nodiscard]] std::size_t LivePrograms() const { return m_programs.size(); }
    [[nodiscard]] bool IsLiveBuffer(render::GpuHandle buffer) const { return m_liveBuffers.contains(buffer); }
    [[nodiscard]] bool IsLiveVertexArray(render::GpuHandle vao) const { return m_liveVertexArrays.contains(vao); }
    [[nodiscard]] render::GpuHandle CurrentProgram() const { return m_currentProgram; }
    [[nodiscard]] render::GpuHandle BoundVertexArray() const { return m_boundVertexArray; }

    // Recorded calls.
    std::vector<std::string> compiledSources;
    std::vector<render::GpuHandle> programBinds;
    std::vector<DrawRecord> draws;
    std::vector<AttributeRecord> attributes;
    std::map<render::GpuHandle, std::size_t> bufferSizes;
    int vertexArraysCreated = 0;
    int buffersCreated = 0;
    int clears = 0;
    glm::vec4 lastClearColor{0.0F};
    bool depthTestEnabled = false;
    bool backFaceCullingEnabled = false;
    int viewportWidth = 0;
    int viewportHeight = 0;

private:
    struct ProgramInfo
    {
        std::vector<std::string> uniformNames;
        std::unordered_map<std::string, int> uniforms;
        std::unordered_map<std::string, int> attributes;
    };

    template <typename T>
    void RecordUniform(int location, const T& value)
    {
        const std::string name = NameForLocation(location);
        m_uniformValues[{m_currentProgram, name}] = render::UniformValue{value};
        ++m_uniformWrites[name];
    }

    [[nodiscard]] std::string NameForLocation(int location) const;

    render::GpuHandle m_nextHandle = 1;
    std::unordered_map<render::GpuHandle, std::pair<render::ShaderStage, std::string>> m_shaders;
    std::unordered_map<render::GpuHandle, ProgramInfo> m_programs;
    std::set<render::GpuHandle> m_liveVertexArrays;
    std::set<render::GpuHandle> m_liveBuffers;
    render::GpuHandle m_currentProgram = render::kNullHandle;
    render::GpuHandle m_boundVertexArray = render::kNullHandle;
    render::GpuHandle m_boundArrayBuffer = render::kNullHandle;

    std::map<std::pair<render::GpuHandle, std::string>, render::UniformValue> m_uniformValues;
    std::map<std::pair<render::GpuHandle, std::string>, std::vector<glm::vec3>> m_uniformArrays;
    std::unordered_map<std::string, int> m_uniformWrites;
};
} // namespace prism::tests
