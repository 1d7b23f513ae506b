#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "prism/render/ExternalServices.hpp"

namespace prism::render
{
/// Compiles user-authored shaders and keeps the last program that built
/// successfully for each shader id.
class CustomProgramRegistry final : public IShaderProgramProvider
{
public:
    explicit CustomProgramRegistry(IGraphicsDevice& device);

    CustomProgramRegistry(const CustomProgramRegistry&) = delete;
    CustomProgramRegistry& operator=(const CustomProgramRegistry&) = delete;

    /// Builds |shaderId| from source. On failure the previous program (if any)
    /// stays active and the error is available from LastError().
    bool Compile(const std::string& shaderId, const std::string& vertexSource, const std::string& fragmentSource,
                 const std::vector<UniformDeclaration>& declarations, std::string* outError = nullptr);

    void Remove(const std::string& shaderId);
    void Clear();

    [[nodiscard]] bool Has(const std::string& shaderId) const;
    /// Number of shader ids with a usable program.
    [[nodiscard]] std::size_t Size() const;
    /// Empty when the most recent compile of |shaderId| succeeded.
    [[nodiscard]] std::string LastError(const std::string& shaderId) const;

    [[nodiscard]] const ShaderProgram* FindProgram(const std::string& shaderId) const override;
    [[nodiscard]] const UniformLocationMap* FindUniformLocations(const std::string& shaderId) const override;

private:
    struct Entry
    {
        std::unique_ptr<ShaderProgram> program;
        UniformLocationMap locations;
        std::string lastError;
    };

    IGraphicsDevice& m_device;
    std::unordered_map<std::string, Entry> m_entries;
};
} // namespace prism::render
