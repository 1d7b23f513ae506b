#include "prism/render/LightPacking.hpp"

#include <glm/geometric.hpp>

namespace prism::render
{
glm::vec3 NormalizeLightDirection(const glm::vec3& direction)
{
    const float length = glm::length(direction);
    if (length <= 1e-6F)
    {
        return glm::vec3{0.0F, -1.0F, 0.0F};
    }
    return direction / length;
}

PackedLights PackLights(const std::vector<scene::LightData>& lights, const glm::vec3& ambient, const LightPackingOptions& options)
{
    PackedLights packed;
    packed.ambient = ambient;

    for (const scene::LightData& light : lights)
    {
        if (packed.count >= kMaxLights)
        {
            break;
        }
        if (!light.enabled)
        {
            continue;
        }
        const auto slot = static_cast<std::size_t>(packed.count);
        packed.directions[slot] = NormalizeLightDirection(light.direction);
        packed.colors[slot] = light.color;
        ++packed.count;
    }

    if (packed.count == 0 && options.useFallbackLight)
    {
        packed.directions[0] = NormalizeLightDirection(options.fallbackDirection);
        packed.colors[0] = options.fallbackColor;
        packed.count = 1;
    }

    return packed;
}
} // namespace prism::render
