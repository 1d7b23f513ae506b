#pragma once

#include <array>
#include <vector>

#include <glm/vec3.hpp>

#include "prism/scene/Components.hpp"

namespace prism::render
{
constexpr int kMaxLights = 8;

/// Fixed-size light arrays ready for upload. Slots past |count| are zero.
struct PackedLights
{
    std::array<glm::vec3, kMaxLights> directions{};
    std::array<glm::vec3, kMaxLights> colors{};
    int count = 0;
    glm::vec3 ambient{0.0F, 0.0F, 0.0F};
};

struct LightPackingOptions
{
    bool useFallbackLight = false;
    glm::vec3 fallbackDirection{-0.5F, -1.0F, -0.5F};
    glm::vec3 fallbackColor{1.0F, 1.0F, 1.0F};
};

/// Unit-length copy of |direction|; a zero vector maps to straight down (0, -1, 0).
[[nodiscard]] glm::vec3 NormalizeLightDirection(const glm::vec3& direction);

/// Packs the first kMaxLights enabled lights in order. Extra lights are dropped.
/// The fallback light is used only when enabled and no light was packed.
[[nodiscard]] PackedLights PackLights(const std::vector<scene::LightData>& lights, const glm::vec3& ambient,
                                      const LightPackingOptions& options = {});
} // namespace prism::render
