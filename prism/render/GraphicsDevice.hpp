#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <glm/mat3x3.hpp>
#include <glm/mat4x4.hpp>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
#include <glm/vec4.hpp>

namespace prism::render
{
using GpuHandle = std::uint32_t;

constexpr GpuHandle kNullHandle = 0;

enum class ShaderStage
{
    Vertex,
    Fragment
};

enum class BufferTarget
{
    Vertex,
    Index
};

enum class PrimitiveMode
{
    Triangles,
    Lines
};

/// Thrown for unrecoverable device failures: shader compile or link errors,
/// failed buffer or vertex array allocation.
class GraphicsError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct ShaderBuildResult
{
    GpuHandle handle = kNullHandle;
    bool success = false;
    std::string log;
};

/// Thin abstraction over the graphics API. Every GL call made by the render
/// core goes through this interface.
class IGraphicsDevice
{
public:
    virtual ~IGraphicsDevice() = default;

    // Shaders and programs.
    virtual ShaderBuildResult CompileShader(ShaderStage stage, const std::string& source) = 0;
    virtual ShaderBuildResult LinkProgram(GpuHandle vertexShader, GpuHandle fragmentShader) = 0;
    virtual void DeleteShader(GpuHandle shader) = 0;
    virtual void DeleteProgram(GpuHandle program) = 0;
    virtual void UseProgram(GpuHandle program) = 0;

    /// Active uniform names with any trailing "[0]" removed.
    [[nodiscard]] virtual std::vector<std::string> ListActiveUniforms(GpuHandle program) = 0;
    [[nodiscard]] virtual int GetUniformLocation(GpuHandle program, const std::string& name) = 0;
    [[nodiscard]] virtual int GetAttribLocation(GpuHandle program, const std::string& name) = 0;

    // Buffers and vertex arrays. Creation returns kNullHandle on failure.
    [[nodiscard]] virtual GpuHandle CreateVertexArray() = 0;
    [[nodiscard]] virtual GpuHandle CreateBuffer() = 0;
    virtual void BindVertexArray(GpuHandle vertexArray) = 0;
    /// Binds |buffer| to |target| and uploads static data.
    virtual void UploadBuffer(BufferTarget target, GpuHandle buffer, const void* data, std::size_t sizeBytes) = 0;
    /// Points |location| at the currently bound vertex buffer as tightly packed floats.
    virtual void SetVertexAttribute(int location, int components) = 0;
    virtual void DeleteVertexArray(GpuHandle vertexArray) = 0;
    virtual void DeleteBuffer(GpuHandle buffer) = 0;

    // Uniform upload on the bound program.
    virtual void SetUniform(int location, float value) = 0;
    virtual void SetUniform(int location, int value) = 0;
    virtual void SetUniform(int location, const glm::vec2& value) = 0;
    virtual void SetUniform(int location, const glm::vec3& value) = 0;
    virtual void SetUniform(int location, const glm::vec4& value) = 0;
    virtual void SetUniform(int location, const glm::mat3& value) = 0;
    virtual void SetUniform(int location, const glm::mat4& value) = 0;
    virtual void SetUniformArray(int location, const glm::vec3* values, int count) = 0;

    // Draw and fixed-function state.
    virtual void DrawIndexed(PrimitiveMode mode, int indexCount) = 0;
    virtual void DrawArrays(PrimitiveMode mode, int first, int vertexCount) = 0;
    virtual void SetDepthTest(bool enabled) = 0;
    virtual void SetBackFaceCulling(bool enabled) = 0;
    virtual void Clear(const glm::vec4& color) = 0;
    virtual void SetViewport(int x, int y, int width, int height) = 0;
};
} // namespace prism::render
