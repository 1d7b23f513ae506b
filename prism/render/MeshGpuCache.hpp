#pragma once

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "prism/render/GraphicsDevice.hpp"
#include "prism/render/ShaderProgram.hpp"
#include "prism/scene/Components.hpp"

namespace prism::render
{
struct GpuMeshResources
{
    GpuHandle vao = kNullHandle;
    GpuHandle positionBuffer = kNullHandle;
    GpuHandle normalBuffer = kNullHandle;
    GpuHandle uvBuffer = kNullHandle; // kNullHandle when the mesh has no UVs
    GpuHandle indexBuffer = kNullHandle;
    int indexCount = 0;
};

struct EdgeGpuResources
{
    GpuHandle vao = kNullHandle;
    GpuHandle positionBuffer = kNullHandle;
    int vertexCount = 0;
};

/// Dense slot storage addressed by entity. Removing an entry frees its slot
/// for the next insert; the slot array never shrinks.
template <typename T>
class SlotArena
{
public:
    [[nodiscard]] T* Find(scene::Entity key)
    {
        const auto it = m_index.find(key);
        return it != m_index.end() ? &*m_slots[it->second] : nullptr;
    }

    [[nodiscard]] bool Contains(scene::Entity key) const { return m_index.contains(key); }

    T& Insert(scene::Entity key, T value)
    {
        std::size_t slot = m_slots.size();
        if (!m_freeSlots.empty())
        {
            slot = m_freeSlots.back();
            m_freeSlots.pop_back();
            m_slots[slot] = std::move(value);
        }
        else
        {
            m_slots.emplace_back(std::move(value));
        }
        m_index[key] = slot;
        return *m_slots[slot];
    }

    std::optional<T> Remove(scene::Entity key)
    {
        const auto it = m_index.find(key);
        if (it == m_index.end())
        {
            return std::nullopt;
        }
        const std::size_t slot = it->second;
        std::optional<T> removed = std::move(m_slots[slot]);
        m_slots[slot].reset();
        m_freeSlots.push_back(slot);
        m_index.erase(it);
        return removed;
    }

    template <typename Fn>
    void ForEach(Fn&& fn)
    {
        for (auto& slot : m_slots)
        {
            if (slot.has_value())
            {
                fn(*slot);
            }
        }
    }

    void Clear()
    {
        m_slots.clear();
        m_index.clear();
        m_freeSlots.clear();
    }

    [[nodiscard]] std::size_t Size() const { return m_index.size(); }
    [[nodiscard]] std::size_t SlotCount() const { return m_slots.size(); }

private:
    std::vector<std::optional<T>> m_slots;
    std::unordered_map<scene::Entity, std::size_t> m_index;
    std::vector<std::size_t> m_freeSlots;
};

/// GPU buffers for entity meshes and their wireframe edges, created lazily and
/// kept until disposed. Returned references stay valid until the next insert.
class MeshGpuCache
{
public:
    explicit MeshGpuCache(IGraphicsDevice& device);
    ~MeshGpuCache();

    MeshGpuCache(const MeshGpuCache&) = delete;
    MeshGpuCache& operator=(const MeshGpuCache&) = delete;

    /// Returns the cached entry for |key| untouched, or uploads |mesh| using the
    /// attribute locations of |program|. Throws GraphicsError on allocation failure.
    const GpuMeshResources& GetOrCreateSolid(scene::Entity key, const scene::MeshData& mesh, const ShaderProgram& program);
    const EdgeGpuResources& GetOrCreateEdges(scene::Entity key, const scene::EdgeData& edges, const ShaderProgram& program);

    [[nodiscard]] bool HasSolid(scene::Entity key) const { return m_solid.Contains(key); }
    [[nodiscard]] bool HasEdges(scene::Entity key) const { return m_edges.Contains(key); }
    [[nodiscard]] std::size_t SolidCount() const { return m_solid.Size(); }
    [[nodiscard]] std::size_t EdgeCount() const { return m_edges.Size(); }
    [[nodiscard]] std::size_t SolidSlotCount() const { return m_solid.SlotCount(); }

    /// Frees both the solid and the edge entry for |key|. No-op for unknown keys.
    void Dispose(scene::Entity key);
    void DisposeSolid(scene::Entity key);
    void DisposeEdges(scene::Entity key);
    void DisposeAll();

private:
    GpuHandle AllocateVertexArray();
    GpuHandle AllocateBuffer();
    void UploadAttribute(GpuHandle buffer, const std::vector<float>& data, int location, int components);
    void Release(const GpuMeshResources& resources);
    void Release(const EdgeGpuResources& resources);

    IGraphicsDevice& m_device;
    SlotArena<GpuMeshResources> m_solid;
    SlotArena<EdgeGpuResources> m_edges;
};
} // namespace prism::render
