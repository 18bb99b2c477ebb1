/**
 * @file SphericalPolygon.cpp
 * @brief Spherical polygon edges, angles, perimeter and area
 */

#include <SphereGeom/Geometry/SphericalPolygon.h>
#include <SphereGeom/Core/Validate.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace Sphere::Geom {

SphericalPolygon::SphericalPolygon(std::vector<SphereCoordinate> vertices)
    : vertices_(std::move(vertices)) {
    const char* funcName = "SphericalPolygon";
    Validate::RequireMinCount(vertices_.size(), MIN_POLYGON_VERTICES, "vertices", funcName);
    for (const auto& vertex : vertices_) {
        Validate::RequireFinite(vertex, "vertex", funcName);
    }
}

SphericalPolygon::SphericalPolygon(std::initializer_list<SphereCoordinate> vertices)
    : SphericalPolygon(std::vector<SphereCoordinate>(vertices)) {}

std::vector<GreatCircleSegment> SphericalPolygon::Edges() const {
    size_t n = vertices_.size();
    std::vector<GreatCircleSegment> edges;
    edges.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        edges.emplace_back(vertices_[i], vertices_[(i + 1) % n]);
    }
    return edges;
}

double SphericalPolygon::InteriorAngleAt(size_t index) const {
    Validate::RequireIndex(index, vertices_.size(), "SphericalPolygon::InteriorAngleAt");
    return VertexAngle(index);
}

double SphericalPolygon::VertexAngle(size_t index) const {
    size_t n = vertices_.size();
    const SphereCoordinate& prev = vertices_[index == 0 ? n - 1 : index - 1];
    const SphereCoordinate& cur = vertices_[index];
    const SphereCoordinate& next = vertices_[(index + 1) % n];

    CartesianVector prevVec = prev.ToCartesian();
    CartesianVector curVec = cur.ToCartesian();
    CartesianVector nextVec = next.ToCartesian();

    // Tangents at cur along the incident edges, each pointing away from cur
    GreatCircleSegment incoming(prev, cur);
    GreatCircleSegment outgoing(cur, next);
    CartesianVector toPrev = incoming.GetTangentAt(cur, prevVec - curVec);
    CartesianVector toNext = outgoing.GetTangentAt(cur, nextVec - curVec);

    // Signed angle from toNext to toPrev about the outward normal
    double sinAngle = curVec.DotProduct(toNext.CrossProduct(toPrev));
    double cosAngle = toNext.DotProduct(toPrev);
    double angle = std::atan2(sinAngle, cosAngle);

    if (angle < -ANGLE_TOLERANCE) {
        angle += TWO_PI;
    } else if (angle < 0.0) {
        // Edges leave in the same direction; rounding must not turn 0 into 2*PI
        angle = 0.0;
    }
    return angle;
}

double SphericalPolygon::Perimeter() const {
    size_t n = vertices_.size();
    double perimeter = 0.0;
    for (size_t i = 0; i < n; ++i) {
        perimeter += GreatCircleSegment::CalculateArcLength(vertices_[i], vertices_[(i + 1) % n]);
    }
    return perimeter;
}

// Look to http://mathworld.wolfram.com/SphericalPolygon.html for details.
// Shortly: S = (sum - (n - 2) * PI) * R^2, where sum is the sum of the vertex angles.
double SphericalPolygon::Area() const {
    size_t n = vertices_.size();
    double anglesSum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        anglesSum += VertexAngle(i);
    }

    // Area of the region to the left of the traversal
    double leftArea = (anglesSum - static_cast<double>(n - 2) * PI) * SPHERE_RADIUS * SPHERE_RADIUS;
    double area = std::min(leftArea, SPHERE_AREA - leftArea);
    return std::max(area, 0.0);
}

} // namespace Sphere::Geom
