#pragma once

/**
 * @file GreatCircle.h
 * @brief Great circle on the unit sphere
 *
 * A great circle is the intersection of the sphere with a plane through the
 * origin. It is stored as the unit normal of that plane.
 *
 * Used by:
 * - Geometry/GreatCircleSegment: base circle of an arc
 * - Geometry/SphericalPolygon: edge tangents for interior angles
 */

#include <SphereGeom/Core/Export.h>
#include <SphereGeom/Core/Constants.h>
#include <SphereGeom/Core/Types.h>

namespace Sphere::Geom {

class SPHEREGEOM_API GreatCircle {
public:
    GreatCircle() = default;

    /**
     * @brief Circle through two points
     *
     * The normal is (a x b) normalized. Identical or antipodal points do not
     * define a unique circle; the result is degenerate (IsValid() == false).
     */
    GreatCircle(const SphereCoordinate& a, const SphereCoordinate& b);

    /**
     * @brief Circle with the given plane normal (normalized internally)
     */
    explicit GreatCircle(const CartesianVector& normal);

    /// Unit normal of the circle's plane
    const CartesianVector& Normal() const { return normal_; }

    /// False for circles built from identical or antipodal points
    bool IsValid() const;

    /**
     * @brief Check if a point lies on the circle
     * @return true if |point . normal| <= tolerance
     */
    bool IsOnCircle(const SphereCoordinate& point, double tolerance = EPSILON) const;

    /// @overload The vector is normalized before the test
    bool IsOnCircle(const CartesianVector& point, double tolerance = EPSILON) const;

    /**
     * @brief One of the two unit tangents at a point on the circle
     *
     * Returns (normal x point) normalized. The other tangent is its negation.
     */
    CartesianVector GetTangentAt(const SphereCoordinate& point) const;

    /**
     * @brief Unit tangent at a point that points along the given direction
     *
     * @param point Point on the circle
     * @param direction Any vector; the returned tangent has a non-negative dot
     *        product with it
     */
    CartesianVector GetTangentAt(const SphereCoordinate& point,
                                 const CartesianVector& direction) const;

    /**
     * @brief Intersect two great circles
     *
     * Two distinct great circles meet in exactly two antipodal points. The
     * first one, (n1 x n2) normalized, is written to @p point; the second is
     * -point.
     *
     * @return false if the circles coincide (normals parallel or
     *         anti-parallel) or either circle is degenerate; @p point is left
     *         untouched then
     */
    bool Intersects(const GreatCircle& other, CartesianVector& point) const;

private:
    CartesianVector normal_{0.0, 1.0, 0.0};
};

} // namespace Sphere::Geom
