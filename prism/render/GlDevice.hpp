#pragma once

#include "prism/render/GraphicsDevice.hpp"

namespace prism::render
{
/// OpenGL 4.5 core implementation of IGraphicsDevice. Requires a current
/// context with glad already loaded.
class GlDevice final : public IGraphicsDevice
{
public:
    GlDevice() = default;

    ShaderBuildResult CompileShader(ShaderStage stage, const std::string& source) override;
    ShaderBuildResult LinkProgram(GpuHandle vertexShader, GpuHandle fragmentShader) override;
    void DeleteShader(GpuHandle shader) override;
    void DeleteProgram(GpuHandle program) override;
    void UseProgram(GpuHandle program) override;

    [[nodiscard]] std::vector<std::string> ListActiveUniforms(GpuHandle program) override;
    [[nodiscard]] int GetUniformLocation(GpuHandle program, const std::string& name) override;
    [[nodiscard]] int GetAttribLocation(GpuHandle program, const std::string& name) override;

    [[nodiscard]] GpuHandle CreateVertexArray() override;
    [[nodiscard]] GpuHandle CreateBuffer() override;
    void BindVertexArray(GpuHandle vertexArray) override;
    void UploadBuffer(BufferTarget target, GpuHandle buffer, const void* data, std::size_t sizeBytes) override;
    void SetVertexAttribute(int location, int components) override;
    void DeleteVertexArray(GpuHandle vertexArray) override;
    void DeleteBuffer(GpuHandle buffer) override;

    void SetUniform(int location, float value) override;
    void SetUniform(int location, int value) override;
    void SetUniform(int location, const glm::vec2& value) override;
    void SetUniform(int location, const glm::vec3& value) override;
    void SetUniform(int location, const glm::vec4& value) override;
    void SetUniform(int location, const glm::mat3& value) override;
    void SetUniform(int location, const glm::mat4& value) override;
    void SetUniformArray(int location, const glm::vec3* values, int count) override;

    void DrawIndexed(PrimitiveMode mode, int indexCount) override;
    void DrawArrays(PrimitiveMode mode, int first, int vertexCount) override;
    void SetDepthTest(bool enabled) override;
    void SetBackFaceCulling(bool enabled) override;
    void Clear(const glm::vec4& color) override;
    void SetViewport(int x, int y, int width, int height) override;
};
} // namespace prism::render
