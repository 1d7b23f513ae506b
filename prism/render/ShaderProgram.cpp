#include "prism/render/ShaderProgram.hpp"

#include <array>
#include <utility>

namespace prism::render
{
namespace
{
constexpr std::array<const char*, 3> kMeshAttributes = {"aPosition", "aNormal", "aTexCoord"};

const char* StageName(ShaderStage stage)
{
    return stage == ShaderStage::Vertex ? "vertex" : "fragment";
}
} // namespace

ShaderProgram::ShaderProgram(IGraphicsDevice& device, std::string name, std::string vertexSource, std::string fragmentSource)
    : m_device(device)
    , m_name(std::move(name))
    , m_vertexSource(std::move(vertexSource))
    , m_fragmentSource(std::move(fragmentSource))
{
}

ShaderProgram::~ShaderProgram()
{
    Dispose();
}

GpuHandle ShaderProgram::CompileStage(ShaderStage stage, const std::string& source)
{
    ShaderBuildResult result = m_device.CompileShader(stage, source);
    if (!result.success)
    {
        throw GraphicsError("[ShaderProgram] '" + m_name + "' " + StageName(stage) + " shader compile error: " + result.log);
    }
    return result.handle;
}

void ShaderProgram::Compile()
{
    Dispose();

    const GpuHandle vertexShader = CompileStage(ShaderStage::Vertex, m_vertexSource);
    GpuHandle fragmentShader = kNullHandle;
    try
    {
        fragmentShader = CompileStage(ShaderStage::Fragment, m_fragmentSource);
    }
    catch (const GraphicsError&)
    {
        m_device.DeleteShader(vertexShader);
        throw;
    }

    ShaderBuildResult linked = m_device.LinkProgram(vertexShader, fragmentShader);
    m_device.DeleteShader(vertexShader);
    m_device.DeleteShader(fragmentShader);
    if (!linked.success)
    {
        throw GraphicsError("[ShaderProgram] '" + m_name + "' program link error: " + linked.log);
    }

    m_program = linked.handle;
    for (const std::string& uniform : m_device.ListActiveUniforms(m_program))
    {
        const int location = m_device.GetUniformLocation(m_program, uniform);
        if (location >= 0)
        {
            m_uniforms[uniform] = location;
        }
    }
    for (const char* attribute : kMeshAttributes)
    {
        m_attributes[attribute] = m_device.GetAttribLocation(m_program, attribute);
    }
}

void ShaderProgram::Use() const
{
    if (m_program != kNullHandle)
    {
        m_device.UseProgram(m_program);
    }
}

void ShaderProgram::Dispose()
{
    if (m_program != kNullHandle)
    {
        m_device.DeleteProgram(m_program);
        m_program = kNullHandle;
    }
    m_uniforms.clear();
    m_attributes.clear();
}

int ShaderProgram::UniformLocation(const std::string& name) const
{
    const auto it = m_uniforms.find(name);
    return it != m_uniforms.end() ? it->second : -1;
}

int ShaderProgram::AttribLocation(const std::string& name) const
{
    if (m_program == kNullHandle)
    {
        return -1;
    }
    const auto it = m_attributes.find(name);
    if (it != m_attributes.end())
    {
        return it->second;
    }
    return m_device.GetAttribLocation(m_program, name);
}

void ShaderProgram::SetVec3(const std::string& name, const glm::vec3& value) const
{
    const int location = UniformLocation(name);
    if (location >= 0)
    {
        m_device.SetUniform(location, value);
    }
}

void ShaderProgram::SetMat4(const std::string& name, const glm::mat4& value) const
{
    const int location = UniformLocation(name);
    if (location >= 0)
    {
        m_device.SetUniform(location, value);
    }
}
} // namespace prism::render
