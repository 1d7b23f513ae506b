#pragma once

#include <filesystem>
#include <string>

#include <glm/vec3.hpp>
#include <glm/vec4.hpp>

#include <nlohmann/json_fwd.hpp>

namespace prism::render
{
struct RendererSettings
{
    glm::vec4 clearColor{0.15F, 0.15F, 0.17F, 1.0F};
    glm::vec3 defaultAmbient{0.15F, 0.15F, 0.2F};
    bool useFallbackLight = false;
    glm::vec3 fallbackLightDirection{-0.5F, -1.0F, -0.5F};
    glm::vec3 fallbackLightColor{1.0F, 1.0F, 1.0F};
    bool wireframeOverlay = false;
    glm::vec3 wireframeColor{0.9F, 0.55F, 0.1F};
    glm::vec3 defaultBaseColor{0.8F, 0.8F, 0.8F};
};

/// Reads known keys from |root| over the defaults; malformed values are
/// ignored and colors are clamped to [0, 1].
[[nodiscard]] RendererSettings RendererSettingsFromJson(const nlohmann::json& root);
[[nodiscard]] nlohmann::json RendererSettingsToJson(const RendererSettings& settings);

/// Loads |path| into |settings|. A missing or invalid file is rewritten with
/// defaults. |status| receives a human-readable note when something was off.
bool LoadRendererSettings(const std::filesystem::path& path, RendererSettings& settings, std::string& status);
bool SaveRendererSettings(const std::filesystem::path& path, const RendererSettings& settings);
} // namespace prism::render
