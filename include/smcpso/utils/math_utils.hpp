/**
 * @file math_utils.hpp
 * @brief Scalar helpers shared by the control laws and the optimizer
 */

#pragma once

#include <algorithm>
#include <cmath>

namespace smcpso::utils {

constexpr double PI = 3.14159265358979323846;
constexpr double HALF_PI = PI / 2.0;

/**
 * @brief Sign function, zero at zero
 */
inline double sign(double x) {
    if (x > 0) return 1.0;
    if (x < 0) return -1.0;
    return 0.0;
}

/**
 * @brief Symmetric saturation to [-limit, limit]
 */
inline double saturate(double value, double limit) {
    return std::clamp(value, -limit, limit);
}

/**
 * @brief Linear interpolation
 * @param t Interpolation factor [0, 1]
 */
inline double lerp(double a, double b, double t) {
    return a + (b - a) * t;
}

/**
 * @brief Divide by a normaliser unless it is too small to be meaningful
 */
inline double safeNormalize(double value, double norm, double threshold) {
    return norm > threshold ? value / norm : value;
}

/**
 * @brief Check all entries of a container are finite
 */
template<typename Container>
bool allFinite(const Container& values) {
    return std::all_of(values.begin(), values.end(),
                       [](double v) { return std::isfinite(v); });
}

}  // namespace smcpso::utils
