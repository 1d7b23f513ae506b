#pragma once

#include <string>
#include <unordered_map>

#include "prism/render/ExternalServices.hpp"

namespace prism::render
{
/// In-memory material assets keyed by asset id.
class MaterialLibrary final : public IMaterialAssetRegistry
{
public:
    void Add(const std::string& assetId, MaterialAsset asset);
    void Remove(const std::string& assetId);
    void Clear() { m_materials.clear(); }

    /// Sets one live parameter. Returns false for an unknown asset.
    bool SetParameter(const std::string& assetId, const std::string& name, UniformValue value);

    [[nodiscard]] const MaterialAsset* FindMaterial(const std::string& assetId) const override;
    [[nodiscard]] std::size_t Size() const { return m_materials.size(); }

private:
    std::unordered_map<std::string, MaterialAsset> m_materials;
};
} // namespace prism::render
