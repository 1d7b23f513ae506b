#include "prism/scene/World.hpp"

#include <string>

#include "prism/core/EventBus.hpp"

namespace prism::scene
{
/// Read-only window onto one entity's components.
class World::EntityView final : public IRenderable, public IMeshProvider
{
public:
    EntityView(const World& world, Entity entity)
        : m_world(world)
        , m_entity(entity)
    {
    }

    [[nodiscard]] Entity Id() const override { return m_entity; }

    [[nodiscard]] const Transform& GetTransform() const override
    {
        static const Transform kIdentity{};
        const auto it = m_world.m_transforms.find(m_entity);
        return it != m_world.m_transforms.end() ? it->second : kIdentity;
    }

    [[nodiscard]] const IMeshProvider* AsMeshProvider() const override
    {
        return m_world.m_meshes.contains(m_entity) ? this : nullptr;
    }

    [[nodiscard]] const MaterialComponent* GetMaterial() const override
    {
        const auto it = m_world.m_materials.find(m_entity);
        return it != m_world.m_materials.end() ? &it->second : nullptr;
    }

    [[nodiscard]] const MeshData* GetMeshData() const override
    {
        const auto it = m_world.m_meshes.find(m_entity);
        if (it == m_world.m_meshes.end() || it->second.mesh.positions.empty())
        {
            return nullptr;
        }
        return &it->second.mesh;
    }

    [[nodiscard]] const EdgeData* GetEdgeData() const override
    {
        const auto it = m_world.m_meshes.find(m_entity);
        if (it == m_world.m_meshes.end() || !it->second.edges.has_value())
        {
            return nullptr;
        }
        return &*it->second.edges;
    }

private:
    const World& m_world;
    Entity m_entity;
};

World::World() = default;

World::~World() = default;

Entity World::CreateEntity()
{
    const Entity entity = m_nextEntity++;
    m_views.emplace(entity, std::make_unique<EntityView>(*this, entity));
    return entity;
}

void World::DestroyEntity(Entity entity)
{
    if (m_views.erase(entity) == 0)
    {
        return;
    }
    m_transforms.erase(entity);
    m_meshes.erase(entity);
    m_materials.erase(entity);
    m_lights.erase(entity);
    m_names.erase(entity);

    if (m_eventBus != nullptr)
    {
        m_eventBus->Publish(core::Event{"scene:objectRemoved", {std::to_string(entity)}});
    }
}

void World::Clear()
{
    for (const Entity entity : Entities())
    {
        DestroyEntity(entity);
    }
}

bool World::HasEntity(Entity entity) const
{
    return m_views.contains(entity);
}

std::vector<Entity> World::Entities() const
{
    std::vector<Entity> entities;
    entities.reserve(m_views.size());
    for (const auto& [entity, _] : m_views)
    {
        entities.push_back(entity);
    }
    return entities;
}

std::vector<const IRenderable*> World::GetRenderables() const
{
    std::vector<const IRenderable*> renderables;
    renderables.reserve(m_views.size());
    for (const auto& [entity, view] : m_views)
    {
        renderables.push_back(view.get());
    }
    return renderables;
}

std::vector<LightData> World::ActiveLights() const
{
    std::vector<LightData> lights;
    for (const auto& [entity, _] : m_views)
    {
        const auto it = m_lights.find(entity);
        if (it != m_lights.end() && it->second.enabled)
        {
            lights.push_back(it->second);
        }
    }
    return lights;
}
} // namespace prism::scene
