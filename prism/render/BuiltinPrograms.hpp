#pragma once

#include <array>
#include <memory>

#include "prism/render/ShaderProgram.hpp"

namespace prism::render
{
enum class BuiltinProgram
{
    Default,
    Pbr,
    Line
};

/// Uniform names shared by the built-in mesh programs and custom programs.
namespace uniforms
{
constexpr const char* kModelMatrix = "uModelMatrix";
constexpr const char* kViewProjectionMatrix = "uViewProjectionMatrix";
constexpr const char* kNormalMatrix = "uNormalMatrix";
constexpr const char* kCameraPosition = "uCameraPosition";
constexpr const char* kLightDirections = "uLightDirections";
constexpr const char* kLightColors = "uLightColors";
constexpr const char* kLightCount = "uLightCount";
constexpr const char* kAmbientColor = "uAmbientColor";

constexpr const char* kBaseColor = "uBaseColor";
constexpr const char* kMetallic = "uMetallic";
constexpr const char* kRoughness = "uRoughness";
constexpr const char* kEmission = "uEmission";
constexpr const char* kEmissionStrength = "uEmissionStrength";

constexpr const char* kModelViewProjection = "uModelViewProjection";
constexpr const char* kColor = "uColor";

constexpr std::array<const char*, 8> kCommon = {
    kModelMatrix, kViewProjectionMatrix, kNormalMatrix, kCameraPosition,
    kLightDirections, kLightColors, kLightCount, kAmbientColor,
};
} // namespace uniforms

[[nodiscard]] const char* BuiltinProgramName(BuiltinProgram program);

/// Creates an uncompiled program for one of the built-in shaders.
[[nodiscard]] std::unique_ptr<ShaderProgram> CreateBuiltinProgram(IGraphicsDevice& device, BuiltinProgram program);
} // namespace prism::render
