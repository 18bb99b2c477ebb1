#pragma once

/**
 * @file SphericalPolygon.h
 * @brief Closed polygon of great-circle edges on the unit sphere
 *
 * Vertices are given in traversal order; the last vertex connects back to the
 * first. Edges must not cross each other (not validated).
 */

#include <SphereGeom/Core/Export.h>
#include <SphereGeom/Core/Constants.h>
#include <SphereGeom/Core/Types.h>
#include <SphereGeom/Geometry/GreatCircleSegment.h>

#include <initializer_list>
#include <vector>

namespace Sphere::Geom {

/// Minimum number of vertices of a polygon
constexpr size_t MIN_POLYGON_VERTICES = 3;

class SPHEREGEOM_API SphericalPolygon {
public:
    /**
     * @brief Polygon from vertices in traversal order
     *
     * @throws InsufficientDataException if fewer than 3 vertices
     * @throws InvalidArgumentException if a vertex is not finite
     */
    explicit SphericalPolygon(std::vector<SphereCoordinate> vertices);

    SphericalPolygon(std::initializer_list<SphereCoordinate> vertices);

    size_t VertexCount() const { return vertices_.size(); }
    const std::vector<SphereCoordinate>& Vertices() const { return vertices_; }

    /// Edge i runs from vertex i to vertex (i + 1) % n
    std::vector<GreatCircleSegment> Edges() const;

    /**
     * @brief Angle at a vertex between its two incident edges
     *
     * Measured counter-clockwise (seen from outside the sphere) from the
     * tangent towards the next vertex to the tangent towards the previous
     * vertex, in [0, 2*PI).
     *
     * @throws OutOfRangeException if index >= VertexCount()
     */
    double InteriorAngleAt(size_t index) const;

    /// Sum of edge lengths (radians on the unit sphere)
    double Perimeter() const;

    /**
     * @brief Enclosed area in steradians
     *
     * Spherical excess: (sum of angles - (n - 2) * PI) * R^2.
     * The cycle splits the sphere in two regions; the smaller one is reported,
     * so the result does not depend on traversal direction and lies in
     * [0, 2*PI]. Vertices collinear on one arc enclose nothing.
     */
    double Area() const;

private:
    double VertexAngle(size_t index) const;

    std::vector<SphereCoordinate> vertices_;
};

} // namespace Sphere::Geom
