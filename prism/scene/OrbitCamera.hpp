#pragma once

#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>

#include "prism/scene/SceneInterfaces.hpp"

namespace prism::scene
{
/// Z-up perspective camera orbiting a target point.
class OrbitCamera final : public ICamera
{
public:
    OrbitCamera() = default;

    void SetTarget(const glm::vec3& target) { m_target = target; }
    void SetAspect(float aspect);
    void SetDistance(float distance);

    /// Angles in degrees. Pitch is clamped short of the poles.
    void Orbit(float deltaYawDegrees, float deltaPitchDegrees);
    void Zoom(float factor);

    [[nodiscard]] glm::mat4 ViewMatrix() const;
    [[nodiscard]] glm::mat4 ProjectionMatrix() const;

    [[nodiscard]] glm::mat4 GetViewProjectionMatrix() const override;
    [[nodiscard]] glm::vec3 Position() const override;

    [[nodiscard]] float Distance() const { return m_distance; }
    [[nodiscard]] float PitchDegrees() const { return m_pitchDegrees; }

private:
    glm::vec3 m_target{0.0F, 0.0F, 0.0F};
    float m_distance = 6.0F;
    float m_yawDegrees = 45.0F;
    float m_pitchDegrees = 25.0F;
    float m_fovDegrees = 50.0F;
    float m_aspect = 16.0F / 9.0F;
    float m_near = 0.05F;
    float m_far = 500.0F;
};
} // namespace prism::scene
