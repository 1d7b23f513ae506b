#pragma once

#include <string>
#include <vector>

#include "prism/render/ShaderProgram.hpp"
#include "prism/render/UniformValue.hpp"

namespace prism::render
{
/// Material asset that drives a custom shader.
struct MaterialAsset
{
    std::string shaderId;
    std::vector<UniformDeclaration> uniforms;
    UniformParameters parameters;
};

class IMaterialAssetRegistry
{
public:
    virtual ~IMaterialAssetRegistry() = default;

    /// nullptr when |assetId| is unknown.
    [[nodiscard]] virtual const MaterialAsset* FindMaterial(const std::string& assetId) const = 0;
};

/// Compiled custom programs keyed by shader id.
class IShaderProgramProvider
{
public:
    virtual ~IShaderProgramProvider() = default;

    [[nodiscard]] virtual const ShaderProgram* FindProgram(const std::string& shaderId) const = 0;
    [[nodiscard]] virtual const UniformLocationMap* FindUniformLocations(const std::string& shaderId) const = 0;
};
} // namespace prism::render
