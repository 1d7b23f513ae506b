#include "prism/render/CustomProgramRegistry.hpp"

#include <iostream>

#include "prism/render/BuiltinPrograms.hpp"

namespace prism::render
{
CustomProgramRegistry::CustomProgramRegistry(IGraphicsDevice& device)
    : m_device(device)
{
}

bool CustomProgramRegistry::Compile(const std::string& shaderId, const std::string& vertexSource,
                                    const std::string& fragmentSource, const std::vector<UniformDeclaration>& declarations, std::string* outError)
{
    auto program = std::make_unique<ShaderProgram>(m_device, "custom:" + shaderId, vertexSource, fragmentSource);
    try
    {
        program->Compile();
    }
    catch (const GraphicsError& error)
    {
        Entry& entry = m_entries[shaderId];
        entry.lastError = error.what();
        if (outError != nullptr)
        {
            *outError = entry.lastError;
        }
        std::cerr << "[CustomProgramRegistry] Compile failed for '" << shaderId << "'"
                  << (entry.program != nullptr ? ", keeping previous program" : "") << ": " << error.what() << "\n";
        return false;
    }

    UniformLocationMap locations;
    const auto resolve = [&locations, &program](const std::string& name) {
        const int location = program->UniformLocation(name);
        if (location >= 0)
        {
            locations[name] = location;
        }
    };
    for (const UniformDeclaration& declaration : declarations)
    {
        resolve(declaration.name);
    }
    for (const char* common : uniforms::kCommon)
    {
        resolve(common);
    }

    Entry& entry = m_entries[shaderId];
    entry.program = std::move(program);
    entry.locations = std::move(locations);
    entry.lastError.clear();
    std::cout << "[CustomProgramRegistry] Compiled '" << shaderId << "' (" << entry.locations.size() << " uniforms)\n";
    return true;
}

void CustomProgramRegistry::Remove(const std::string& shaderId)
{
    m_entries.erase(shaderId);
}

void CustomProgramRegistry::Clear()
{
    m_entries.clear();
}

bool CustomProgramRegistry::Has(const std::string& shaderId) const
{
    return FindProgram(shaderId) != nullptr;
}

std::size_t CustomProgramRegistry::Size() const
{
    std::size_t count = 0;
    for (const auto& [shaderId, entry] : m_entries)
    {
        if (entry.program != nullptr)
        {
            ++count;
        }
    }
    return count;
}

std::string CustomProgramRegistry::LastError(const std::string& shaderId) const
{
    const auto it = m_entries.find(shaderId);
    return it != m_entries.end() ? it->second.lastError : std::string{};
}

const ShaderProgram* CustomProgramRegistry::FindProgram(const std::string& shaderId) const
{
    const auto it = m_entries.find(shaderId);
    if (it == m_entries.end() || it->second.program == nullptr || !it->second.program->IsReady())
    {
        return nullptr;
    }
    return it->second.program.get();
}

const UniformLocationMap* CustomProgramRegistry::FindUniformLocations(const std::string& shaderId) const
{
    const auto it = m_entries.find(shaderId);
    if (it == m_entries.end() || it->second.program == nullptr)
    {
        return nullptr;
    }
    return &it->second.locations;
}
} // namespace prism::render
