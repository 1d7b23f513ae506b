#include "prism/scene/Primitives.hpp"

#include <algorithm>
#include <array>
#include <bitset>
#include <cmath>

#include <glm/gtc/constants.hpp>
#include <glm/vec2.hpp>

namespace prism::scene
{
namespace
{
struct CubeFace
{
    glm::vec3 normal;
    glm::vec3 u;
    glm::vec3 v; // cross(u, v) == normal
};

const std::array<CubeFace, 6> kCubeFaces = {{
    {{1.0F, 0.0F, 0.0F}, {0.0F, 1.0F, 0.0F}, {0.0F, 0.0F, 1.0F}},
    {{-1.0F, 0.0F, 0.0F}, {0.0F, 0.0F, 1.0F}, {0.0F, 1.0F, 0.0F}},
    {{0.0F, 1.0F, 0.0F}, {0.0F, 0.0F, 1.0F}, {1.0F, 0.0F, 0.0F}},
    {{0.0F, -1.0F, 0.0F}, {1.0F, 0.0F, 0.0F}, {0.0F, 0.0F, 1.0F}},
    {{0.0F, 0.0F, 1.0F}, {1.0F, 0.0F, 0.0F}, {0.0F, 1.0F, 0.0F}},
    {{0.0F, 0.0F, -1.0F}, {0.0F, 1.0F, 0.0F}, {1.0F, 0.0F, 0.0F}},
}};

void Append(std::vector<float>& out, const glm::vec3& v)
{
    out.push_back(v.x);
    out.push_back(v.y);
    out.push_back(v.z);
}

void AppendLine(EdgeData& edges, const glm::vec3& a, const glm::vec3& b)
{
    Append(edges.lineVertices, a);
    Append(edges.lineVertices, b);
    ++edges.lineCount;
}

glm::vec3 SphereDirection(int segment, int ring, int segments, int rings)
{
    const float theta = glm::pi<float>() * static_cast<float>(ring) / static_cast<float>(rings);
    const float phi = glm::two_pi<float>() * static_cast<float>(segment) / static_cast<float>(segments);
    return glm::vec3{std::sin(theta) * std::cos(phi), std::sin(theta) * std::sin(phi), std::cos(theta)};
}
} // namespace

MeshData CreateCubeMesh(float size)
{
    const float h = size * 0.5F;
    const std::array<glm::vec2, 4> kCorners = {{{-1.0F, -1.0F}, {1.0F, -1.0F}, {1.0F, 1.0F}, {-1.0F, 1.0F}}};

    MeshData mesh;
    mesh.positions.reserve(24 * 3);
    mesh.normals.reserve(24 * 3);
    mesh.uvs.reserve(24 * 2);
    mesh.indices.reserve(36);

    for (const CubeFace& face : kCubeFaces)
    {
        const auto base = static_cast<std::uint32_t>(mesh.positions.size() / 3);
        for (const glm::vec2& corner : kCorners)
        {
            Append(mesh.positions, (face.normal + face.u * corner.x + face.v * corner.y) * h);
            Append(mesh.normals, face.normal);
            mesh.uvs.push_back(corner.x * 0.5F + 0.5F);
            mesh.uvs.push_back(corner.y * 0.5F + 0.5F);
        }
        mesh.indices.insert(mesh.indices.end(), {base, base + 1, base + 2, base, base + 2, base + 3});
    }
    return mesh;
}

EdgeData CreateCubeEdges(float size)
{
    const float h = size * 0.5F;
    const auto corner = [h](unsigned bits) {
        return glm::vec3{(bits & 1U) != 0U ? h : -h, (bits & 2U) != 0U ? h : -h, (bits & 4U) != 0U ? h : -h};
    };

    EdgeData edges;
    for (unsigned a = 0; a < 8; ++a)
    {
        for (unsigned b = a + 1; b < 8; ++b)
        {
            // Cube edges join corners that differ along exactly one axis.
            if (std::bitset<3>(a ^ b).count() == 1)
            {
                AppendLine(edges, corner(a), corner(b));
            }
        }
    }
    return edges;
}

MeshData CreateUvSphereMesh(float radius, int segments, int rings)
{
    segments = std::max(3, segments);
    rings = std::max(2, rings);

    MeshData mesh;
    const auto vertexCount = static_cast<std::size_t>((segments + 1) * (rings + 1));
    mesh.positions.reserve(vertexCount * 3);
    mesh.normals.reserve(vertexCount * 3);
    mesh.uvs.reserve(vertexCount * 2);

    for (int ring = 0; ring <= rings; ++ring)
    {
        for (int segment = 0; segment <= segments; ++segment)
        {
            const glm::vec3 normal = SphereDirection(segment, ring, segments, rings);
            Append(mesh.positions, normal * radius);
            Append(mesh.normals, normal);
            mesh.uvs.push_back(static_cast<float>(segment) / static_cast<float>(segments));
            mesh.uvs.push_back(static_cast<float>(ring) / static_cast<float>(rings));
        }
    }

    const auto stride = static_cast<std::uint32_t>(segments + 1);
    for (int ring = 0; ring < rings; ++ring)
    {
        for (int segment = 0; segment < segments; ++segment)
        {
            const std::uint32_t a = static_cast<std::uint32_t>(ring) * stride + static_cast<std::uint32_t>(segment);
            const std::uint32_t b = a + stride;
            // Skip the zero-area triangle that touches each pole.
            if (ring != 0)
            {
                mesh.indices.insert(mesh.indices.end(), {a, b, a + 1});
            }
            if (ring != rings - 1)
            {
                mesh.indices.insert(mesh.indices.end(), {a + 1, b, b + 1});
            }
        }
    }
    return mesh;
}

EdgeData CreateUvSphereEdges(float radius, int segments, int rings)
{
    segments = std::max(3, segments);
    rings = std::max(2, rings);

    EdgeData edges;
    for (int ring = 1; ring < rings; ++ring)
    {
        for (int segment = 0; segment < segments; ++segment)
        {
            AppendLine(edges, SphereDirection(segment, ring, segments, rings) * radius,
                       SphereDirection(segment + 1, ring, segments, rings) * radius);
        }
    }
    for (int segment = 0; segment < segments; ++segment)
    {
        for (int ring = 0; ring < rings; ++ring)
        {
            AppendLine(edges, SphereDirection(segment, ring, segments, rings) * radius,
                       SphereDirection(segment, ring + 1, segments, rings) * radius);
        }
    }
    return edges;
}
} // namespace prism::scene
