#pragma once

/**
 * @file Validate.h
 * @brief Argument validation helpers for SphereGeom constructors
 *
 * Design principles:
 * - Checks throw; they never clamp or repair input
 * - Consistent error message format: "<funcName>: <reason>"
 * - Only construction-time preconditions are validated here. Degenerate
 *   numeric input to pure operations (zero vectors) is left to IsValid().
 */

#include <SphereGeom/Core/Export.h>
#include <SphereGeom/Core/Exception.h>
#include <SphereGeom/Core/Types.h>

#include <cstdio>
#include <string>

namespace Sphere::Geom::Validate {

// =============================================================================
// Internal Formatting
// =============================================================================

namespace Detail {

// Format double with limited precision (avoid long tails)
inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6g", val);
    return buf;
}

inline std::string FormatValue(size_t val) {
    return std::to_string(val);
}

inline std::string FormatCoordinate(const SphereCoordinate& coord) {
    return "(theta=" + FormatValue(coord.theta) + ", phi=" + FormatValue(coord.phi) + ")";
}

} // namespace Detail

// =============================================================================
// Value Checks
// =============================================================================

/**
 * @brief Require a finite coordinate
 * @throws InvalidArgumentException if theta or phi is NaN or infinite
 */
inline void RequireFinite(const SphereCoordinate& coord, const char* name,
                          const char* funcName) {
    if (!coord.IsValid()) {
        throw InvalidArgumentException(std::string(funcName) + ": " + name +
                                       " is not finite " + Detail::FormatCoordinate(coord));
    }
}

/**
 * @brief Require a finite vector
 * @throws InvalidArgumentException if any component is NaN or infinite
 */
inline void RequireFinite(const CartesianVector& v, const char* name,
                          const char* funcName) {
    if (!v.IsValid()) {
        throw InvalidArgumentException(std::string(funcName) + ": " + name + " is not finite");
    }
}

/**
 * @brief Require |dot| of a point against a plane normal to be within tolerance
 *
 * @param offset Signed distance of the point from the plane
 * @throws InvalidArgumentException if the point lies off the plane
 */
inline void RequireOnCircle(double offset, const SphereCoordinate& coord,
                            const char* name, const char* funcName,
                            double tolerance = EPSILON) {
    if (!(std::abs(offset) <= tolerance)) {
        throw InvalidArgumentException(std::string(funcName) + ": " + name + " " +
                                       Detail::FormatCoordinate(coord) +
                                       " is not on the base circle (offset " +
                                       Detail::FormatValue(offset) + ")");
    }
}

// =============================================================================
// Count / Index Checks
// =============================================================================

/**
 * @brief Require at least minCount items
 * @throws InsufficientDataException if count < minCount
 */
inline void RequireMinCount(size_t count, size_t minCount, const char* what,
                            const char* funcName) {
    if (count < minCount) {
        throw InsufficientDataException(std::string(funcName) + ": need at least " +
                                        Detail::FormatValue(minCount) + " " + what +
                                        ", got " + Detail::FormatValue(count));
    }
}

/**
 * @brief Require index < count
 * @throws OutOfRangeException otherwise
 */
inline void RequireIndex(size_t index, size_t count, const char* funcName) {
    if (index >= count) {
        throw OutOfRangeException(std::string(funcName) + ": index " +
                                  Detail::FormatValue(index) + " >= " +
                                  Detail::FormatValue(count));
    }
}

} // namespace Sphere::Geom::Validate
