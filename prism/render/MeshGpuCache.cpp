#include "prism/render/MeshGpuCache.hpp"

#include <exception>

namespace prism::render
{
MeshGpuCache::MeshGpuCache(IGraphicsDevice& device)
    : m_device(device)
{
}

MeshGpuCache::~MeshGpuCache()
{
    DisposeAll();
}

GpuHandle MeshGpuCache::AllocateVertexArray()
{
    const GpuHandle vao = m_device.CreateVertexArray();
    if (vao == kNullHandle)
    {
        throw GraphicsError("[MeshGpuCache] Failed to create vertex array.");
    }
    return vao;
}

GpuHandle MeshGpuCache::AllocateBuffer()
{
    const GpuHandle buffer = m_device.CreateBuffer();
    if (buffer == kNullHandle)
    {
        throw GraphicsError("[MeshGpuCache] Failed to create buffer.");
    }
    return buffer;
}

void MeshGpuCache::UploadAttribute(GpuHandle buffer, const std::vector<float>& data, int location, int components)
{
    m_device.UploadBuffer(BufferTarget::Vertex, buffer, data.data(), data.size() * sizeof(float));
    if (location >= 0)
    {
        m_device.SetVertexAttribute(location, components);
    }
}

const GpuMeshResources& MeshGpuCache::GetOrCreateSolid(scene::Entity key, const scene::MeshData& mesh, const ShaderProgram& program)
{
    if (GpuMeshResources* cached = m_solid.Find(key))
    {
        return *cached;
    }

    GpuMeshResources resources;
    try
    {
        resources.vao = AllocateVertexArray();
        m_device.BindVertexArray(resources.vao);

        resources.positionBuffer = AllocateBuffer();
        UploadAttribute(resources.positionBuffer, mesh.positions, program.AttribLocation("aPosition"), 3);

        resources.normalBuffer = AllocateBuffer();
        UploadAttribute(resources.normalBuffer, mesh.normals, program.AttribLocation("aNormal"), 3);

        if (mesh.HasUvs())
        {
            resources.uvBuffer = AllocateBuffer();
            UploadAttribute(resources.uvBuffer, mesh.uvs, program.AttribLocation("aTexCoord"), 2);
        }

        // Element buffer binding is captured by the bound vertex array.
        resources.indexBuffer = AllocateBuffer();
        m_device.UploadBuffer(BufferTarget::Index, resources.indexBuffer, mesh.indices.data(), mesh.indices.size() * sizeof(std::uint32_t));
        resources.indexCount = static_cast<int>(mesh.indices.size());

        m_device.BindVertexArray(kNullHandle);
        return m_solid.Insert(key, resources);
    }
    catch (const std::exception&)
    {
        m_device.BindVertexArray(kNullHandle);
        Release(resources);
        throw;
    }
}

const EdgeGpuResources& MeshGpuCache::GetOrCreateEdges(scene::Entity key, const scene::EdgeData& edges, const ShaderProgram& program)
{
    if (EdgeGpuResources* cached = m_edges.Find(key))
    {
        return *cached;
    }

    EdgeGpuResources resources;
    try
    {
        resources.vao = AllocateVertexArray();
        m_device.BindVertexArray(resources.vao);

        resources.positionBuffer = AllocateBuffer();
        UploadAttribute(resources.positionBuffer, edges.lineVertices, program.AttribLocation("aPosition"), 3);
        resources.vertexCount = static_cast<int>(edges.lineCount * 2U);

        m_device.BindVertexArray(kNullHandle);
        return m_edges.Insert(key, resources);
    }
    catch (const std::exception&)
    {
        m_device.BindVertexArray(kNullHandle);
        Release(resources);
        throw;
    }
}

void MeshGpuCache::Release(const GpuMeshResources& resources)
{
    m_device.DeleteBuffer(resources.positionBuffer);
    m_device.DeleteBuffer(resources.normalBuffer);
    m_device.DeleteBuffer(resources.uvBuffer);
    m_device.DeleteBuffer(resources.indexBuffer);
    m_device.DeleteVertexArray(resources.vao);
}

void MeshGpuCache::Release(const EdgeGpuResources& resources)
{
    m_device.DeleteBuffer(resources.positionBuffer);
    m_device.DeleteVertexArray(resources.vao);
}

void MeshGpuCache::Dispose(scene::Entity key)
{
    DisposeSolid(key);
    DisposeEdges(key);
}

void MeshGpuCache::DisposeSolid(scene::Entity key)
{
    if (const auto removed = m_solid.Remove(key))
    {
        Release(*removed);
    }
}

void MeshGpuCache::DisposeEdges(scene::Entity key)
{
    if (const auto removed = m_edges.Remove(key))
    {
        Release(*removed);
    }
}

void MeshGpuCache::DisposeAll()
{
    m_solid.ForEach([this](const GpuMeshResources& resources) { Release(resources); });
    m_edges.ForEach([this](const EdgeGpuResources& resources) { Release(resources); });
    m_solid.Clear();
    m_edges.Clear();
}
} // namespace prism::render
