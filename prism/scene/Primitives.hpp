#pragma once

#include "prism/scene/Components.hpp"

namespace prism::scene
{
/// Axis-aligned cube centred on the origin, 24 vertices with per-face normals
/// and UVs, counter-clockwise outward winding.
[[nodiscard]] MeshData CreateCubeMesh(float size = 1.0F);
/// The 12 cube edges.
[[nodiscard]] EdgeData CreateCubeEdges(float size = 1.0F);

/// Z-up UV sphere. |segments| around the equator (min 3), |rings| pole to pole (min 2).
[[nodiscard]] MeshData CreateUvSphereMesh(float radius = 0.5F, int segments = 32, int rings = 16);
/// Latitude and longitude lines matching CreateUvSphereMesh.
[[nodiscard]] EdgeData CreateUvSphereEdges(float radius = 0.5F, int segments = 32, int rings = 16);
} // namespace prism::scene
