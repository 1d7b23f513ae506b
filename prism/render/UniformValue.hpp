#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

#include <glm/mat3x3.hpp>
#include <glm/mat4x4.hpp>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
#include <glm/vec4.hpp>

#include "prism/render/GraphicsDevice.hpp"

namespace prism::render
{
enum class UniformType
{
    Float,
    Int,
    Bool,
    Vec2,
    Vec3,
    Vec4,
    Mat3,
    Mat4,
    Sampler2D,
    Unknown
};

using UniformValue = std::variant<std::monostate, float, int, bool, glm::vec2, glm::vec3, glm::vec4, glm::mat3, glm::mat4>;

/// Uniform exposed by a custom shader, as declared in its material asset.
struct UniformDeclaration
{
    std::string name;
    UniformType type = UniformType::Float;
    UniformValue defaultValue;
    std::string displayName;
};

using UniformParameters = std::unordered_map<std::string, UniformValue>;
using UniformLocationMap = std::unordered_map<std::string, int>;

/// Maps a GLSL type keyword ("float", "vec3", "sampler2D", ...) to UniformType.
[[nodiscard]] UniformType UniformTypeFromText(std::string_view text);
[[nodiscard]] const char* UniformTypeToText(UniformType type);

/// Uploads |value| as |type| at |location| on the bound program. Scalars
/// convert between float, int and bool; vector and matrix types must match
/// exactly. Returns false without touching the device when the location is
/// invalid, the type is unsupported or the value does not fit the type.
bool UploadUniform(IGraphicsDevice& device, int location, UniformType type, const UniformValue& value);
} // namespace prism::render
