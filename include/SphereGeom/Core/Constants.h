#pragma once

/**
 * @file Constants.h
 * @brief Mathematical constants and the shared tolerance utilities
 *
 * Every equality, membership and containment test in SphereGeom compares
 * against EPSILON through ApproxEqual()/IsZero(), so numerical behavior is the
 * same across all value types.
 */

#include <cmath>

namespace Sphere::Geom {

// =============================================================================
// Mathematical Constants
// =============================================================================

constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;
constexpr double HALF_PI = 0.5 * PI;
constexpr double QUARTER_PI = 0.25 * PI;
constexpr double FOUR_PI = 4.0 * PI;

constexpr double DEG_TO_RAD = PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / PI;

/// Radius of the sphere all coordinates live on
constexpr double SPHERE_RADIUS = 1.0;

/// Surface area of the unit sphere (steradians)
constexpr double SPHERE_AREA = FOUR_PI * SPHERE_RADIUS * SPHERE_RADIUS;

// =============================================================================
// Tolerances
// =============================================================================

/// Absolute tolerance for all geometric comparisons
constexpr double EPSILON = 1e-9;

/// Tolerance for angle comparisons (radians)
constexpr double ANGLE_TOLERANCE = 1e-9;

// =============================================================================
// Helpers
// =============================================================================

/// |a - b| <= tolerance
inline bool ApproxEqual(double a, double b, double tolerance = EPSILON) {
    return std::abs(a - b) <= tolerance;
}

/// |value| <= tolerance
inline bool IsZero(double value, double tolerance = EPSILON) {
    return std::abs(value) <= tolerance;
}

template<typename T>
inline T Clamp(T value, T lo, T hi) {
    return value < lo ? lo : (value > hi ? hi : value);
}

template<typename T>
inline T Square(T value) {
    return value * value;
}

/// Normalize angle to [0, 2*PI)
inline double NormalizeAngle0To2PI(double angle) {
    if (angle >= 0.0 && angle < TWO_PI) return angle;

    angle = std::fmod(angle, TWO_PI);
    if (angle < 0.0) angle += TWO_PI;
    // fmod of a tiny negative value can round up to exactly 2*PI
    if (angle >= TWO_PI) angle = 0.0;
    return angle;
}

/// Normalize angle to [-PI, PI)
inline double NormalizeAngle(double angle) {
    if (angle >= -PI && angle < PI) return angle;

    angle = std::fmod(angle + PI, TWO_PI);
    if (angle < 0.0) angle += TWO_PI;
    return angle - PI;
}

} // namespace Sphere::Geom
