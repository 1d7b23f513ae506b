#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <glm/vec3.hpp>

namespace prism::scene
{
using Entity = std::uint32_t;

constexpr Entity kInvalidEntity = 0;

struct Transform
{
    glm::vec3 position{0.0F, 0.0F, 0.0F};
    glm::vec3 rotationEuler{0.0F, 0.0F, 0.0F}; // degrees, applied X then Y then Z
    glm::vec3 scale{1.0F, 1.0F, 1.0F};
};

/// Flat triangle-list geometry. Three floats per position and normal, two per UV.
/// An empty |uvs| means the mesh has no texture coordinates.
struct MeshData
{
    std::vector<float> positions;
    std::vector<float> normals;
    std::vector<float> uvs;
    std::vector<std::uint32_t> indices;

    [[nodiscard]] bool HasUvs() const { return !uvs.empty(); }
    [[nodiscard]] std::size_t VertexCount() const { return positions.size() / 3; }
};

/// Line-list geometry, two vertices per line.
struct EdgeData
{
    std::vector<float> lineVertices;
    std::uint32_t lineCount = 0;
};

/// Directional light. |direction| points from the light into the scene.
struct LightData
{
    glm::vec3 direction{0.0F, -1.0F, 0.0F};
    glm::vec3 color{1.0F, 1.0F, 1.0F};
    bool enabled = true;
};

struct MaterialComponent
{
    std::string shaderName = "default";
    std::optional<glm::vec3> color;
    std::optional<float> metallic;
    std::optional<float> roughness;
    std::optional<glm::vec3> emission;
    std::optional<float> emissionStrength;
    // Reference into the material asset registry; set for custom shaders.
    std::optional<std::string> materialAssetId;
};

struct NameComponent
{
    std::string name;
};
} // namespace prism::scene
