#pragma once

/**
 * @file Types.h
 * @brief Core value types for SphereGeom
 *
 * - CartesianVector: 3D vector with algebra and tolerant equality
 * - SphereCoordinate: (theta, phi) angular position on the unit sphere
 *
 * Conventions:
 * - theta is the colatitude in [0, PI], measured from +Y
 * - phi is the longitude in [0, 2*PI), measured from +Z towards +X
 * - Conversions between the two are explicit (ToCartesian / FromCartesian)
 */

#include <SphereGeom/Core/Export.h>
#include <SphereGeom/Core/Constants.h>

#include <cmath>
#include <cstddef>
#include <functional>

namespace Sphere::Geom {

// =============================================================================
// CartesianVector
// =============================================================================

/**
 * @brief Point or direction in 3D Cartesian space
 *
 * X runs left to right, Y bottom to top, Z far away to close.
 *
 * @note Length() and AsUnitVector() are undefined for the zero vector; the
 *       result is non-finite (check with IsValid()).
 */
struct SPHEREGEOM_API CartesianVector {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    CartesianVector() = default;
    CartesianVector(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    bool IsValid() const { return std::isfinite(x) && std::isfinite(y) && std::isfinite(z); }

    /// Euclidean norm
    double Length() const {
        return std::sqrt(x * x + y * y + z * z);
    }

    /// This vector scaled to length 1
    CartesianVector AsUnitVector() const {
        double len = Length();
        return {x / len, y / len, z / len};
    }

    CartesianVector CrossProduct(const CartesianVector& other) const {
        return {y * other.z - other.y * z,
                other.x * z - x * other.z,
                x * other.y - other.x * y};
    }

    double DotProduct(const CartesianVector& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    /// Straight-line distance to another point
    double DistanceTo(const CartesianVector& other) const {
        return (*this - other).Length();
    }

    CartesianVector operator-() const {
        return {-x, -y, -z};
    }

    CartesianVector operator+(const CartesianVector& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    CartesianVector operator-(const CartesianVector& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    CartesianVector operator*(double s) const {
        return {x * s, y * s, z * s};
    }

    /// Component-wise equality within EPSILON
    bool operator==(const CartesianVector& other) const {
        return ApproxEqual(x, other.x) && ApproxEqual(y, other.y) && ApproxEqual(z, other.z);
    }

    bool operator!=(const CartesianVector& other) const {
        return !(*this == other);
    }

    /**
     * @brief Hash over components quantized to the EPSILON grid
     *
     * Vectors that compare equal and fall into the same grid cell get the same
     * hash. Two equal vectors straddling a cell boundary can still differ;
     * exact agreement is impossible for a non-transitive tolerant equality.
     */
    struct SPHEREGEOM_API Hash {
        size_t operator()(const CartesianVector& v) const;
    };
};

inline CartesianVector operator*(double s, const CartesianVector& v) {
    return v * s;
}

// =============================================================================
// SphereCoordinate
// =============================================================================

/**
 * @brief Angular position on the unit sphere
 */
struct SPHEREGEOM_API SphereCoordinate {
    double theta = 0.0;     ///< Colatitude (radians), 0 = +Y pole
    double phi = 0.0;       ///< Longitude (radians), 0 = +Z meridian

    SphereCoordinate() = default;
    SphereCoordinate(double theta_, double phi_) : theta(theta_), phi(phi_) {}

    bool IsValid() const { return std::isfinite(theta) && std::isfinite(phi); }

    /// Unit vector of this coordinate
    CartesianVector ToCartesian() const;

    /// Angular form of a (not necessarily unit) nonzero vector
    static SphereCoordinate FromCartesian(const CartesianVector& v);

    /// Same point on the sphere (compares the Cartesian forms)
    bool operator==(const SphereCoordinate& other) const;

    bool operator!=(const SphereCoordinate& other) const {
        return !(*this == other);
    }
};

// =============================================================================
// Conversions
// =============================================================================

/**
 * @brief Spherical to Cartesian
 *
 * x = sin(theta) * sin(phi), y = cos(theta), z = sin(theta) * cos(phi)
 */
SPHEREGEOM_API CartesianVector ToCartesian(const SphereCoordinate& coord);

/**
 * @brief Cartesian to spherical
 *
 * The input is normalized first. theta = acos(y), phi = atan2(x, z) mapped to
 * [0, 2*PI).
 *
 * @note The zero vector has no angular form; the result is NaN.
 */
SPHEREGEOM_API SphereCoordinate FromCartesian(const CartesianVector& v);

} // namespace Sphere::Geom

namespace std {

template<>
struct hash<Sphere::Geom::CartesianVector> {
    size_t operator()(const Sphere::Geom::CartesianVector& v) const {
        return Sphere::Geom::CartesianVector::Hash()(v);
    }
};

} // namespace std
