/**
 * @file MathTypes.h
 * @brief Vector type aliases shared by the input system
 * @author Actuate Team
 * @date 2025
 */

#pragma once

// GLM configuration - set before including GLM headers
#define GLM_FORCE_RADIANS
#define GLM_ENABLE_EXPERIMENTAL

#include <glm/glm.hpp>

#include <cstdint>

namespace actuate::math {
    // ============================================================================
    // Base Type Aliases from GLM
    // ============================================================================

    using Float = float;
    using Int = std::int32_t;

    using Vec2 = glm::vec2; // float precision
    using Vec2i = glm::ivec2; // integer, used for pixel positions

    inline const auto VEC2_ZERO = Vec2(0.0f, 0.0f);
    inline const auto VEC2I_ZERO = Vec2i(0, 0);

    /**
     * @brief Convert an integer pixel position to float
     */
    [[nodiscard]] inline Vec2 toVec2(const Vec2i& v) noexcept {
        return Vec2(static_cast<Float>(v.x), static_cast<Float>(v.y));
    }
} // namespace actuate::math
