#pragma once

#include <string>

#include "prism/render/GraphicsDevice.hpp"
#include "prism/render/UniformValue.hpp"

namespace prism::render
{
/// Linked vertex + fragment program with its uniform locations resolved once
/// after linking. Owns the GPU program handle.
class ShaderProgram
{
public:
    ShaderProgram(IGraphicsDevice& device, std::string name, std::string vertexSource, std::string fragmentSource);
    ~ShaderProgram();

    ShaderProgram(const ShaderProgram&) = delete;
    ShaderProgram& operator=(const ShaderProgram&) = delete;

    /// Compiles both stages, links and caches every active uniform location.
    /// Throws GraphicsError carrying the driver log on failure. Recompiling a
    /// ready program disposes the previous handle first.
    void Compile();
    void Use() const;
    /// Deletes the program and clears cached state. Safe to call repeatedly.
    void Dispose();

    [[nodiscard]] bool IsReady() const { return m_program != kNullHandle; }
    [[nodiscard]] GpuHandle Handle() const { return m_program; }
    [[nodiscard]] const std::string& Name() const { return m_name; }
    [[nodiscard]] const UniformLocationMap& Uniforms() const { return m_uniforms; }

    /// -1 when the uniform is not active in the linked program.
    [[nodiscard]] int UniformLocation(const std::string& name) const;
    [[nodiscard]] int AttribLocation(const std::string& name) const;

    // Uploads by name. Uniforms the program does not expose are skipped.
    void SetVec3(const std::string& name, const glm::vec3& value) const;
    void SetMat4(const std::string& name, const glm::mat4& value) const;

private:
    GpuHandle CompileStage(ShaderStage stage, const std::string& source);

    IGraphicsDevice& m_device;
    std::string m_name;
    std::string m_vertexSource;
    std::string m_fragmentSource;

    GpuHandle m_program = kNullHandle;
    UniformLocationMap m_uniforms;
    UniformLocationMap m_attributes;
};
} // namespace prism::render
