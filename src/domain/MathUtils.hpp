/**
 * @file MathUtils.hpp
 * @brief Small scalar helpers shared by the profile and tension models.
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <string>

namespace dreadloom::domain {

inline float Clamp01(float value) {
    return std::clamp(value, 0.0f, 1.0f);
}

/** @brief Linear interpolation with @p t clamped to [0,1]. */
inline float Lerp(float a, float b, float t) {
    return a + (b - a) * Clamp01(t);
}

inline std::string ToLower(const std::string& value) {
    std::string out = value;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

} // namespace dreadloom::domain
