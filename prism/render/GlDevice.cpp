#include "prism/render/GlDevice.hpp"

#include <glad/glad.h>

#include <glm/gtc/type_ptr.hpp>

namespace prism::render
{
namespace
{
GLenum ToGlStage(ShaderStage stage)
{
    return stage == ShaderStage::Vertex ? GL_VERTEX_SHADER : GL_FRAGMENT_SHADER;
}

GLenum ToGlTarget(BufferTarget target)
{
    return target == BufferTarget::Vertex ? GL_ARRAY_BUFFER : GL_ELEMENT_ARRAY_BUFFER;
}

GLenum ToGlMode(PrimitiveMode mode)
{
    return mode == PrimitiveMode::Triangles ? GL_TRIANGLES : GL_LINES;
}

std::string StripArraySuffix(std::string name)
{
    const std::size_t bracket = name.find('[');
    if (bracket != std::string::npos)
    {
        name.erase(bracket);
    }
    return name;
}
} // namespace

ShaderBuildResult GlDevice::CompileShader(ShaderStage stage, const std::string& source)
{
    ShaderBuildResult result;
    const unsigned int shader = glCreateShader(ToGlStage(stage));
    if (shader == 0)
    {
        result.log = "glCreateShader returned 0";
        return result;
    }

    const char* text = source.c_str();
    glShaderSource(shader, 1, &text, nullptr);
    glCompileShader(shader);

    int success = 0;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
    if (success == GL_FALSE)
    {
        int logLength = 0;
        glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &logLength);
        std::string log(static_cast<std::size_t>(logLength), '\0');
        glGetShaderInfoLog(shader, logLength, nullptr, log.data());
        glDeleteShader(shader);
        result.log = std::move(log);
        return result;
    }

    result.handle = shader;
    result.success = true;
    return result;
}

ShaderBuildResult GlDevice::LinkProgram(GpuHandle vertexShader, GpuHandle fragmentShader)
{
    ShaderBuildResult result;
    const unsigned int program = glCreateProgram();
    if (program == 0)
    {
        result.log = "glCreateProgram returned 0";
        return result;
    }

    glAttachShader(program, vertexShader);
    glAttachShader(program, fragmentShader);
    glLinkProgram(program);

    int success = 0;
    glGetProgramiv(program, GL_LINK_STATUS, &success);
    if (success == GL_FALSE)
    {
        int logLength = 0;
        glGetProgramiv(program, GL_INFO_LOG_LENGTH, &logLength);
        std::string log(static_cast<std::size_t>(logLength), '\0');
        glGetProgramInfoLog(program, logLength, nullptr, log.data());
        glDeleteProgram(program);
        result.log = std::move(log);
        return result;
    }

    glDetachShader(program, vertexShader);
    glDetachShader(program, fragmentShader);
    result.handle = program;
    result.success = true;
    return result;
}

void GlDevice::DeleteShader(GpuHandle shader)
{
    if (shader != kNullHandle)
    {
        glDeleteShader(shader);
    }
}

void GlDevice::DeleteProgram(GpuHandle program)
{
    if (program != kNullHandle)
    {
        glDeleteProgram(program);
    }
}

void GlDevice::UseProgram(GpuHandle program)
{
    glUseProgram(program);
}

std::vector<std::string> GlDevice::ListActiveUniforms(GpuHandle program)
{
    int count = 0;
    int maxLength = 0;
    glGetProgramiv(program, GL_ACTIVE_UNIFORMS, &count);
    glGetProgramiv(program, GL_ACTIVE_UNIFORM_MAX_LENGTH, &maxLength);

    std::vector<std::string> names;
    names.reserve(static_cast<std::size_t>(count));
    std::string buffer(static_cast<std::size_t>(maxLength) + 1, '\0');
    for (int i = 0; i < count; ++i)
    {
        GLsizei length = 0;
        GLint size = 0;
        GLenum type = 0;
        glGetActiveUniform(program, static_cast<GLuint>(i), static_cast<GLsizei>(buffer.size()), &length, &size, &type, buffer.data());
        names.push_back(StripArraySuffix(buffer.substr(0, static_cast<std::size_t>(length))));
    }
    return names;
}

int GlDevice::GetUniformLocation(GpuHandle program, const std::string& name)
{
    return glGetUniformLocation(program, name.c_str());
}

int GlDevice::GetAttribLocation(GpuHandle program, const std::string& name)
{
    return glGetAttribLocation(program, name.c_str());
}

GpuHandle GlDevice::CreateVertexArray()
{
    unsigned int vao = 0;
    glGenVertexArrays(1, &vao);
    return vao;
}

GpuHandle GlDevice::CreateBuffer()
{
    unsigned int buffer = 0;
    glGenBuffers(1, &buffer);
    return buffer;
}

void GlDevice::BindVertexArray(GpuHandle vertexArray)
{
    glBindVertexArray(vertexArray);
}

void GlDevice::UploadBuffer(BufferTarget target, GpuHandle buffer, const void* data, std::size_t sizeBytes)
{
    const GLenum glTarget = ToGlTarget(target);
    glBindBuffer(glTarget, buffer);
    glBufferData(glTarget, static_cast<GLsizeiptr>(sizeBytes), data, GL_STATIC_DRAW);
}

void GlDevice::SetVertexAttribute(int location, int components)
{
    const auto index = static_cast<GLuint>(location);
    glEnableVertexAttribArray(index);
    glVertexAttribPointer(index, components, GL_FLOAT, GL_FALSE, 0, nullptr);
}

void GlDevice::DeleteVertexArray(GpuHandle vertexArray)
{
    if (vertexArray != kNullHandle)
    {
        glDeleteVertexArrays(1, &vertexArray);
    }
}

void GlDevice::DeleteBuffer(GpuHandle buffer)
{
    if (buffer != kNullHandle)
    {
        glDeleteBuffers(1, &buffer);
    }
}

void GlDevice::SetUniform(int location, float value)
{
    glUniform1f(location, value);
}

void GlDevice::SetUniform(int location, int value)
{
    glUniform1i(location, value);
}

void GlDevice::SetUniform(int location, const glm::vec2& value)
{
    glUniform2fv(location, 1, glm::value_ptr(value));
}

void GlDevice::SetUniform(int location, const glm::vec3& value)
{
    glUniform3fv(location, 1, glm::value_ptr(value));
}

void GlDevice::SetUniform(int location, const glm::vec4& value)
{
    glUniform4fv(location, 1, glm::value_ptr(value));
}

void GlDevice::SetUniform(int location, const glm::mat3& value)
{
    glUniformMatrix3fv(location, 1, GL_FALSE, glm::value_ptr(value));
}

void GlDevice::SetUniform(int location, const glm::mat4& value)
{
    glUniformMatrix4fv(location, 1, GL_FALSE, glm::value_ptr(value));
}

void GlDevice::SetUniformArray(int location, const glm::vec3* values, int count)
{
    glUniform3fv(location, count, glm::value_ptr(values[0]));
}

void GlDevice::DrawIndexed(PrimitiveMode mode, int indexCount)
{
    glDrawElements(ToGlMode(mode), indexCount, GL_UNSIGNED_INT, nullptr);
}

void GlDevice::DrawArrays(PrimitiveMode mode, int first, int vertexCount)
{
    glDrawArrays(ToGlMode(mode), first, vertexCount);
}

void GlDevice::SetDepthTest(bool enabled)
{
    if (enabled)
    {
        glEnable(GL_DEPTH_TEST);
        glDepthFunc(GL_LESS);
    }
    else
    {
        glDisable(GL_DEPTH_TEST);
    }
}

void GlDevice::SetBackFaceCulling(bool enabled)
{
    if (enabled)
    {
        glEnable(GL_CULL_FACE);
        glCullFace(GL_BACK);
        glFrontFace(GL_CCW);
    }
    else
    {
        glDisable(GL_CULL_FACE);
    }
}

void GlDevice::Clear(const glm::vec4& color)
{
    glClearColor(color.r, color.g, color.b, color.a);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
}

void GlDevice::SetViewport(int x, int y, int width, int height)
{
    glViewport(x, y, width, height);
}
} // namespace prism::render
