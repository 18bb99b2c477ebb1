#pragma once

/**
 * @file GreatCircleSegment.h
 * @brief Bounded arc of a great circle between two coordinates
 *
 * The arc always follows the shorter path between Start and End. Its length
 * is the angular distance in radians (equal to the arc length on the unit
 * sphere).
 */

#include <SphereGeom/Core/Export.h>
#include <SphereGeom/Core/Constants.h>
#include <SphereGeom/Core/Types.h>
#include <SphereGeom/Geometry/GreatCircle.h>

namespace Sphere::Geom {

class SPHEREGEOM_API GreatCircleSegment {
public:
    GreatCircleSegment() = default;

    /**
     * @brief Arc between two coordinates, base circle derived from them
     */
    GreatCircleSegment(const SphereCoordinate& start, const SphereCoordinate& end);

    /**
     * @brief Arc between two coordinates on an explicit base circle
     *
     * @throws InvalidArgumentException if start or end is not on baseCircle
     */
    GreatCircleSegment(const GreatCircle& baseCircle, const SphereCoordinate& start,
                       const SphereCoordinate& end);

    const GreatCircle& BaseCircle() const { return baseCircle_; }
    const SphereCoordinate& Start() const { return start_; }
    const SphereCoordinate& End() const { return end_; }

    /// Angular length in radians, in [0, PI]
    double Length() const { return length_; }

    /**
     * @brief Length of the shorter great-circle arc between two coordinates
     *
     * 2 * asin(chord / 2), chord being the straight-line distance between the
     * two unit vectors.
     */
    static double CalculateArcLength(const SphereCoordinate& start, const SphereCoordinate& end);

    /// @overload For unit vectors
    static double CalculateArcLength(const CartesianVector& start, const CartesianVector& end);

    /**
     * @brief Point on the arc at equal distance from Start and End
     *
     * Candidate is (start + end) normalized; its antipode is returned if the
     * candidate is not on the arc. For antipodal endpoints the base circle
     * tangent at Start is used as candidate.
     */
    CartesianVector Midpoint() const;

    /**
     * @brief Check if a point is on the arc (not just on the base circle)
     *
     * True if dist(point, Start) + dist(point, End) == Length within
     * tolerance. For antipodal endpoints that sum is PI everywhere, so base
     * circle membership is required as well.
     */
    bool IsOnArc(const SphereCoordinate& point, double tolerance = EPSILON) const;

    /// @overload For unit vectors
    bool IsOnArc(const CartesianVector& point, double tolerance = EPSILON) const;

    /// One of the two base circle tangents at point
    CartesianVector GetTangentAt(const SphereCoordinate& point) const;

    /// Base circle tangent at point with non-negative dot product against direction
    CartesianVector GetTangentAt(const SphereCoordinate& point,
                                 const CartesianVector& direction) const;

    /**
     * @brief Intersect with another arc
     *
     * @param other Arc to test
     * @param intersection Receives the crossing point if found
     * @return false if either arc has zero length, the base circles coincide,
     *         or neither antipodal candidate lies on both arcs
     */
    bool Intersects(const GreatCircleSegment& other, SphereCoordinate& intersection) const;

private:
    bool HasAntipodalEnds() const;

    GreatCircle baseCircle_;
    SphereCoordinate start_;
    SphereCoordinate end_;
    double length_ = 0.0;
};

} // namespace Sphere::Geom
