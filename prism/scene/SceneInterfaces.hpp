#pragma once

#include <vector>

#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>

#include "prism/scene/Components.hpp"

namespace prism::scene
{
/// Source of drawable geometry. Either accessor may return nullptr when the
/// entity currently has nothing to draw.
class IMeshProvider
{
public:
    virtual ~IMeshProvider() = default;

    [[nodiscard]] virtual const MeshData* GetMeshData() const = 0;
    [[nodiscard]] virtual const EdgeData* GetEdgeData() const = 0;
};

class IRenderable
{
public:
    virtual ~IRenderable() = default;

    [[nodiscard]] virtual Entity Id() const = 0;
    [[nodiscard]] virtual const Transform& GetTransform() const = 0;
    [[nodiscard]] virtual const IMeshProvider* AsMeshProvider() const = 0;
    [[nodiscard]] virtual const MaterialComponent* GetMaterial() const = 0;
};

class IScene
{
public:
    virtual ~IScene() = default;

    /// Renderables in draw order.
    [[nodiscard]] virtual std::vector<const IRenderable*> GetRenderables() const = 0;
};

class ICamera
{
public:
    virtual ~ICamera() = default;

    [[nodiscard]] virtual glm::mat4 GetViewProjectionMatrix() const = 0;
    [[nodiscard]] virtual glm::vec3 Position() const = 0;
};

class ILightAggregator
{
public:
    virtual ~ILightAggregator() = default;

    /// Lights in priority order. Only the first kMaxLights enabled entries are used.
    [[nodiscard]] virtual std::vector<LightData> ActiveLights() const = 0;
    [[nodiscard]] virtual glm::vec3 AmbientColor() const = 0;
};
} // namespace prism::scene
