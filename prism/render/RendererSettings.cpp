#include "prism/render/RendererSettings.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>

#include <glm/common.hpp>

#include <nlohmann/json.hpp>

namespace prism::render
{
namespace
{
using json = nlohmann::json;

bool ReadVec3(const json& root, const char* key, glm::vec3& out)
{
    if (!root.contains(key) || !root[key].is_array() || root[key].size() != 3)
    {
        return false;
    }
    const json& array = root[key];
    if (!std::all_of(array.begin(), array.end(), [](const json& v) { return v.is_number(); }))
    {
        return false;
    }
    out = glm::vec3{array[0].get<float>(), array[1].get<float>(), array[2].get<float>()};
    return true;
}

bool ReadVec4(const json& root, const char* key, glm::vec4& out)
{
    if (!root.contains(key) || !root[key].is_array() || root[key].size() != 4)
    {
        return false;
    }
    const json& array = root[key];
    if (!std::all_of(array.begin(), array.end(), [](const json& v) { return v.is_number(); }))
    {
        return false;
    }
    out = glm::vec4{array[0].get<float>(), array[1].get<float>(), array[2].get<float>(), array[3].get<float>()};
    return true;
}

json ToArray(const glm::vec3& v)
{
    return json::array({v.x, v.y, v.z});
}

json ToArray(const glm::vec4& v)
{
    return json::array({v.x, v.y, v.z, v.w});
}
} // namespace

RendererSettings RendererSettingsFromJson(const json& root)
{
    RendererSettings settings;
    if (!root.is_object())
    {
        return settings;
    }

    ReadVec4(root, "clear_color", settings.clearColor);
    ReadVec3(root, "default_ambient", settings.defaultAmbient);
    if (root.contains("use_fallback_light") && root["use_fallback_light"].is_boolean())
    {
        settings.useFallbackLight = root["use_fallback_light"].get<bool>();
    }
    ReadVec3(root, "fallback_light_direction", settings.fallbackLightDirection);
    ReadVec3(root, "fallback_light_color", settings.fallbackLightColor);
    if (root.contains("wireframe_overlay") && root["wireframe_overlay"].is_boolean())
    {
        settings.wireframeOverlay = root["wireframe_overlay"].get<bool>();
    }
    ReadVec3(root, "wireframe_color", settings.wireframeColor);
    ReadVec3(root, "default_base_color", settings.defaultBaseColor);

    settings.clearColor = glm::clamp(settings.clearColor, glm::vec4{0.0F}, glm::vec4{1.0F});
    settings.defaultAmbient = glm::clamp(settings.defaultAmbient, glm::vec3{0.0F}, glm::vec3{1.0F});
    settings.wireframeColor = glm::clamp(settings.wireframeColor, glm::vec3{0.0F}, glm::vec3{1.0F});
    settings.defaultBaseColor = glm::clamp(settings.defaultBaseColor, glm::vec3{0.0F}, glm::vec3{1.0F});
    // Light colors may exceed 1 for HDR intensity but never go negative.
    settings.fallbackLightColor = glm::max(settings.fallbackLightColor, glm::vec3{0.0F});
    return settings;
}

json RendererSettingsToJson(const RendererSettings& settings)
{
    json root;
    root["clear_color"] = ToArray(settings.clearColor);
    root["default_ambient"] = ToArray(settings.defaultAmbient);
    root["use_fallback_light"] = settings.useFallbackLight;
    root["fallback_light_direction"] = ToArray(settings.fallbackLightDirection);
    root["fallback_light_color"] = ToArray(settings.fallbackLightColor);
    root["wireframe_overlay"] = settings.wireframeOverlay;
    root["wireframe_color"] = ToArray(settings.wireframeColor);
    root["default_base_color"] = ToArray(settings.defaultBaseColor);
    return root;
}

bool LoadRendererSettings(const std::filesystem::path& path, RendererSettings& settings, std::string& status)
{
    settings = RendererSettings{};
    status.clear();

    if (!std::filesystem::exists(path))
    {
        status = "Renderer config missing. Wrote defaults.";
        return SaveRendererSettings(path, settings);
    }

    std::ifstream stream(path);
    if (!stream.is_open())
    {
        status = "Failed to open renderer config.";
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const json::parse_error& error)
    {
        std::cerr << "[RendererSettings] " << path.string() << ": " << error.what() << "\n";
        status = "Invalid renderer JSON. Using defaults.";
        stream.close();
        return SaveRendererSettings(path, settings);
    }

    if (!root.is_object())
    {
        status = "Renderer config is not an object. Using defaults.";
        stream.close();
        return SaveRendererSettings(path, settings);
    }

    settings = RendererSettingsFromJson(root);
    return true;
}

bool SaveRendererSettings(const std::filesystem::path& path, const RendererSettings& settings)
{
    std::error_code ec;
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::ofstream stream(path);
    if (!stream.is_open())
    {
        std::cerr << "[RendererSettings] Failed to write " << path.string() << "\n";
        return false;
    }
    stream << RendererSettingsToJson(settings).dump(2);
    return true;
}
} // namespace prism::render
