#include "prism/scene/OrbitCamera.hpp"

#include <algorithm>
#include <cmath>

#include <glm/gtc/matrix_transform.hpp>
#include <glm/trigonometric.hpp>

namespace prism::scene
{
namespace
{
constexpr float kMaxPitchDegrees = 89.0F;
constexpr float kMinDistance = 0.1F;
} // namespace

void OrbitCamera::SetAspect(float aspect)
{
    if (aspect > 0.0F)
    {
        m_aspect = aspect;
    }
}

void OrbitCamera::SetDistance(float distance)
{
    m_distance = std::max(kMinDistance, distance);
}

void OrbitCamera::Orbit(float deltaYawDegrees, float deltaPitchDegrees)
{
    m_yawDegrees = std::fmod(m_yawDegrees + deltaYawDegrees, 360.0F);
    m_pitchDegrees = std::clamp(m_pitchDegrees + deltaPitchDegrees, -kMaxPitchDegrees, kMaxPitchDegrees);
}

void OrbitCamera::Zoom(float factor)
{
    if (factor > 0.0F)
    {
        SetDistance(m_distance * factor);
    }
}

glm::vec3 OrbitCamera::Position() const
{
    const float yaw = glm::radians(m_yawDegrees);
    const float pitch = glm::radians(m_pitchDegrees);
    const glm::vec3 offset{std::cos(pitch) * std::cos(yaw), std::cos(pitch) * std::sin(yaw), std::sin(pitch)};
    return m_target + offset * m_distance;
}

glm::mat4 OrbitCamera::ViewMatrix() const
{
    return glm::lookAt(Position(), m_target, glm::vec3{0.0F, 0.0F, 1.0F});
}

glm::mat4 OrbitCamera::ProjectionMatrix() const
{
    return glm::perspective(glm::radians(m_fovDegrees), m_aspect, m_near, m_far);
}

glm::mat4 OrbitCamera::GetViewProjectionMatrix() const
{
    return ProjectionMatrix() * ViewMatrix();
}
} // namespace prism::scene
