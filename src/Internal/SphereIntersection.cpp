/**
 * @file SphereIntersection.cpp
 * @brief Implementation of great circle and arc intersections
 */

#include <SphereGeom/Internal/SphereIntersection.h>

namespace Sphere::Geom::Internal {

// =============================================================================
// Circle-Circle Intersection
// =============================================================================

bool AreCirclesCoincident(const GreatCircle& c1, const GreatCircle& c2, double tolerance) {
    CartesianVector cross = c1.Normal().CrossProduct(c2.Normal());
    return cross.Length() <= tolerance;
}

SphereIntersectionResult IntersectGreatCircles(const GreatCircle& c1, const GreatCircle& c2) {
    if (!c1.IsValid() || !c2.IsValid()) {
        return SphereIntersectionResult::None();
    }

    if (AreCirclesCoincident(c1, c2)) {
        return SphereIntersectionResult::None();
    }

    // Both planes pass through the origin, so they meet along the line
    // spanned by n1 x n2
    CartesianVector direction = c1.Normal().CrossProduct(c2.Normal());
    return SphereIntersectionResult::At(direction.AsUnitVector());
}

// =============================================================================
// Arc-Arc Intersection
// =============================================================================

SphereIntersectionResult IntersectArcs(const GreatCircleSegment& a1, const GreatCircleSegment& a2) {
    if (IsZero(a1.Length()) || IsZero(a2.Length())) {
        return SphereIntersectionResult::None();
    }

    SphereIntersectionResult circles = IntersectGreatCircles(a1.BaseCircle(), a2.BaseCircle());
    if (!circles) {
        return SphereIntersectionResult::None();
    }

    if (a1.IsOnArc(circles.point) && a2.IsOnArc(circles.point)) {
        return SphereIntersectionResult::At(circles.point);
    }
    if (a1.IsOnArc(circles.antipode) && a2.IsOnArc(circles.antipode)) {
        return SphereIntersectionResult::At(circles.antipode);
    }

    return SphereIntersectionResult::None();
}

} // namespace Sphere::Geom::Internal
