#include "prism/render/MaterialLibrary.hpp"

#include <utility>

namespace prism::render
{
void MaterialLibrary::Add(const std::string& assetId, MaterialAsset asset)
{
    m_materials[assetId] = std::move(asset);
}

void MaterialLibrary::Remove(const std::string& assetId)
{
    m_materials.erase(assetId);
}

bool MaterialLibrary::SetParameter(const std::string& assetId, const std::string& name, UniformValue value)
{
    const auto it = m_materials.find(assetId);
    if (it == m_materials.end())
    {
        return false;
    }
    it->second.parameters[name] = std::move(value);
    return true;
}

const MaterialAsset* MaterialLibrary::FindMaterial(const std::string& assetId) const
{
    const auto it = m_materials.find(assetId);
    return it != m_materials.end() ? &it->second : nullptr;
}
} // namespace prism::render
