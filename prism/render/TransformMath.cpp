#include "prism/render/TransformMath.hpp"

#include <cmath>

#include <glm/gtc/matrix_inverse.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/matrix.hpp>
#include <glm/trigonometric.hpp>

namespace prism::render
{
namespace
{
constexpr float kSingularDeterminant = 1e-10F;
}

glm::mat4 ComputeModelMatrix(const scene::Transform& transform)
{
    glm::mat4 model = glm::translate(glm::mat4(1.0F), transform.position);
    model = glm::rotate(model, glm::radians(transform.rotationEuler.z), glm::vec3{0.0F, 0.0F, 1.0F});
    model = glm::rotate(model, glm::radians(transform.rotationEuler.y), glm::vec3{0.0F, 1.0F, 0.0F});
    model = glm::rotate(model, glm::radians(transform.rotationEuler.x), glm::vec3{1.0F, 0.0F, 0.0F});
    model = glm::scale(model, transform.scale);
    return model;
}

glm::mat3 ComputeNormalMatrix(const glm::mat4& model)
{
    const glm::mat3 upper(model);
    if (std::abs(glm::determinant(upper)) < kSingularDeterminant)
    {
        return glm::mat3(1.0F);
    }
    return glm::inverseTranspose(upper);
}
} // namespace prism::render
