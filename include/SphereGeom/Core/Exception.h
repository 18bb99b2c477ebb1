#pragma once

#include <SphereGeom/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for SphereGeom
 *
 * Only precondition violations are reported by exception. Expected outcomes
 * such as "these arcs do not intersect" are returned as bool.
 */

#include <stdexcept>
#include <string>

namespace Sphere::Geom {

/**
 * @brief Base exception class for SphereGeom
 */
class SPHEREGEOM_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}

    explicit Exception(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid argument (e.g. arc endpoint not on the supplied great circle)
 */
class SPHEREGEOM_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief Index or value outside the accepted range
 */
class SPHEREGEOM_API OutOfRangeException : public Exception {
public:
    explicit OutOfRangeException(const std::string& message)
        : Exception("Out of range: " + message) {}
};

/**
 * @brief Not enough input for the construction (e.g. polygon with 2 vertices)
 */
class SPHEREGEOM_API InsufficientDataException : public Exception {
public:
    explicit InsufficientDataException(const std::string& message)
        : Exception("Insufficient data: " + message) {}
};

} // namespace Sphere::Geom
