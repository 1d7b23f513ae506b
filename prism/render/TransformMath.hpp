#pragma once

#include <glm/mat3x3.hpp>
#include <glm/mat4x4.hpp>

#include "prism/scene/Components.hpp"

namespace prism::render
{
/// T * Rz * Ry * Rx * S with Euler angles in degrees.
[[nodiscard]] glm::mat4 ComputeModelMatrix(const scene::Transform& transform);

/// Inverse-transpose of the upper 3x3 of |model|. Returns identity when the
/// upper 3x3 is singular (for example a zero scale axis).
[[nodiscard]] glm::mat3 ComputeNormalMatrix(const glm::mat4& model);
} // namespace prism::render
