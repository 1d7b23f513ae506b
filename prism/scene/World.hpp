#pragma once

#include <map>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include <glm/vec3.hpp>

#include "prism/scene/Components.hpp"
#include "prism/scene/SceneInterfaces.hpp"

namespace prism::core
{
class EventBus;
}

namespace prism::scene
{
struct MeshComponent
{
    MeshData mesh;
    std::optional<EdgeData> edges;
};

/// Editor scene: entities with optional transform, mesh, material, light and
/// name components. Renderables are reported in creation order.
class World final : public IScene, public ILightAggregator
{
public:
    World();
    ~World() override;

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    Entity CreateEntity();
    /// Removes every component of |entity| and publishes "scene:objectRemoved"
    /// when an event bus is attached.
    void DestroyEntity(Entity entity);
    /// Destroys every entity. Ids keep increasing afterwards.
    void Clear();

    [[nodiscard]] bool HasEntity(Entity entity) const;

    void SetEventBus(core::EventBus* eventBus) { m_eventBus = eventBus; }
    void SetAmbientColor(const glm::vec3& color) { m_ambientColor = color; }

    std::unordered_map<Entity, Transform>& Transforms() { return m_transforms; }
    std::unordered_map<Entity, MeshComponent>& Meshes() { return m_meshes; }
    std::unordered_map<Entity, MaterialComponent>& Materials() { return m_materials; }
    std::unordered_map<Entity, LightData>& Lights() { return m_lights; }
    std::unordered_map<Entity, NameComponent>& Names() { return m_names; }

    [[nodiscard]] const std::unordered_map<Entity, Transform>& Transforms() const { return m_transforms; }
    [[nodiscard]] const std::unordered_map<Entity, MeshComponent>& Meshes() const { return m_meshes; }
    [[nodiscard]] const std::unordered_map<Entity, MaterialComponent>& Materials() const { return m_materials; }
    [[nodiscard]] const std::unordered_map<Entity, LightData>& Lights() const { return m_lights; }
    [[nodiscard]] const std::unordered_map<Entity, NameComponent>& Names() const { return m_names; }

    [[nodiscard]] std::vector<Entity> Entities() const;

    [[nodiscard]] std::vector<const IRenderable*> GetRenderables() const override;
    [[nodiscard]] std::vector<LightData> ActiveLights() const override;
    [[nodiscard]] glm::vec3 AmbientColor() const override { return m_ambientColor; }

private:
    class EntityView;

    Entity m_nextEntity = 1;
    std::map<Entity, std::unique_ptr<EntityView>> m_views;
    std::unordered_map<Entity, Transform> m_transforms;
    std::unordered_map<Entity, MeshComponent> m_meshes;
    std::unordered_map<Entity, MaterialComponent> m_materials;
    std::unordered_map<Entity, LightData> m_lights;
    std::unordered_map<Entity, NameComponent> m_names;

    glm::vec3 m_ambientColor{0.15F, 0.15F, 0.2F};
    core::EventBus* m_eventBus = nullptr;
};
} // namespace prism::scene
