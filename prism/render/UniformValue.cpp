#include "prism/render/UniformValue.hpp"

#include <cmath>
#include <optional>

namespace prism::render
{
namespace
{
std::optional<float> AsFloat(const UniformValue& value)
{
    if (const auto* f = std::get_if<float>(&value))
    {
        return *f;
    }
    if (const auto* i = std::get_if<int>(&value))
    {
        return static_cast<float>(*i);
    }
    if (const auto* b = std::get_if<bool>(&value))
    {
        return *b ? 1.0F : 0.0F;
    }
    return std::nullopt;
}

std::optional<int> AsInt(const UniformValue& value)
{
    if (const auto* i = std::get_if<int>(&value))
    {
        return *i;
    }
    if (const auto* f = std::get_if<float>(&value))
    {
        // Only values that truncate into int range convert.
        if (!std::isfinite(*f) || *f <= -2147483904.0F || *f >= 2147483648.0F)
        {
            return std::nullopt;
        }
        return static_cast<int>(*f);
    }
    if (const auto* b = std::get_if<bool>(&value))
    {
        return *b ? 1 : 0;
    }
    return std::nullopt;
}

template <typename T>
bool UploadExact(IGraphicsDevice& device, int location, const UniformValue& value)
{
    const auto* typed = std::get_if<T>(&value);
    if (typed == nullptr)
    {
        return false;
    }
    device.SetUniform(location, *typed);
    return true;
}
} // namespace

UniformType UniformTypeFromText(std::string_view text)
{
    if (text == "float")
    {
        return UniformType::Float;
    }
    if (text == "int")
    {
        return UniformType::Int;
    }
    if (text == "bool")
    {
        return UniformType::Bool;
    }
    if (text == "vec2")
    {
        return UniformType::Vec2;
    }
    if (text == "vec3")
    {
        return UniformType::Vec3;
    }
    if (text == "vec4")
    {
        return UniformType::Vec4;
    }
    if (text == "mat3")
    {
        return UniformType::Mat3;
    }
    if (text == "mat4")
    {
        return UniformType::Mat4;
    }
    if (text == "sampler2D")
    {
        return UniformType::Sampler2D;
    }
    return UniformType::Unknown;
}

const char* UniformTypeToText(UniformType type)
{
    switch (type)
    {
        case UniformType::Float: return "float";
        case UniformType::Int: return "int";
        case UniformType::Bool: return "bool";
        case UniformType::Vec2: return "vec2";
        case UniformType::Vec3: return "vec3";
        case UniformType::Vec4: return "vec4";
        case UniformType::Mat3: return "mat3";
        case UniformType::Mat4: return "mat4";
        case UniformType::Sampler2D: return "sampler2D";
        case UniformType::Unknown: break;
    }
    return "unknown";
}

bool UploadUniform(IGraphicsDevice& device, int location, UniformType type, const UniformValue& value)
{
    if (location < 0)
    {
        return false;
    }

    switch (type)
    {
        case UniformType::Float:
        {
            const std::optional<float> scalar = AsFloat(value);
            if (!scalar.has_value())
            {
                return false;
            }
            device.SetUniform(location, *scalar);
            return true;
        }
        case UniformType::Int:
        case UniformType::Bool:
        {
            std::optional<int> scalar = AsInt(value);
            if (!scalar.has_value())
            {
                return false;
            }
            if (type == UniformType::Bool)
            {
                scalar = *scalar != 0 ? 1 : 0;
            }
            device.SetUniform(location, *scalar);
            return true;
        }
        case UniformType::Vec2: return UploadExact<glm::vec2>(device, location, value);
        case UniformType::Vec3: return UploadExact<glm::vec3>(device, location, value);
        case UniformType::Vec4: return UploadExact<glm::vec4>(device, location, value);
        case UniformType::Mat3: return UploadExact<glm::mat3>(device, location, value);
        case UniformType::Mat4: return UploadExact<glm::mat4>(device, location, value);
        case UniformType::Sampler2D:
        case UniformType::Unknown:
            // Texture binding is not handled by the forward pipeline.
            break;
    }
    return false;
}
} // namespace prism::render
