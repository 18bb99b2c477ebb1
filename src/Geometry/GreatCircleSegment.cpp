/**
 * @file GreatCircleSegment.cpp
 * @brief Arc length, midpoint, containment and arc intersection
 */

#include <SphereGeom/Geometry/GreatCircleSegment.h>
#include <SphereGeom/Core/Validate.h>
#include <SphereGeom/Internal/SphereIntersection.h>

#include <cmath>

namespace Sphere::Geom {

GreatCircleSegment::GreatCircleSegment(const SphereCoordinate& start, const SphereCoordinate& end)
    : baseCircle_(start, end)
    , start_(start)
    , end_(end)
    , length_(CalculateArcLength(start, end)) {}

GreatCircleSegment::GreatCircleSegment(const GreatCircle& baseCircle,
                                       const SphereCoordinate& start,
                                       const SphereCoordinate& end)
    : baseCircle_(baseCircle)
    , start_(start)
    , end_(end)
    , length_(CalculateArcLength(start, end)) {
    const char* funcName = "GreatCircleSegment";
    Validate::RequireFinite(baseCircle.Normal(), "baseCircle normal", funcName);
    Validate::RequireOnCircle(start.ToCartesian().DotProduct(baseCircle.Normal()),
                              start, "start", funcName);
    Validate::RequireOnCircle(end.ToCartesian().DotProduct(baseCircle.Normal()),
                              end, "end", funcName);
}

double GreatCircleSegment::CalculateArcLength(const SphereCoordinate& start,
                                              const SphereCoordinate& end) {
    return CalculateArcLength(start.ToCartesian(), end.ToCartesian());
}

double GreatCircleSegment::CalculateArcLength(const CartesianVector& start,
                                              const CartesianVector& end) {
    // Chord of the unit circle: c = 2 * sin(angle / 2)
    double chord = (start - end).Length();
    return 2.0 * std::asin(Clamp(chord * 0.5, 0.0, 1.0));
}

bool GreatCircleSegment::HasAntipodalEnds() const {
    return IsZero((start_.ToCartesian() + end_.ToCartesian()).Length());
}

CartesianVector GreatCircleSegment::Midpoint() const {
    CartesianVector candidate;
    if (HasAntipodalEnds()) {
        candidate = baseCircle_.GetTangentAt(start_);
    } else {
        candidate = (start_.ToCartesian() + end_.ToCartesian()).AsUnitVector();
    }

    if (IsOnArc(candidate)) {
        return candidate;
    }
    return -candidate;
}

bool GreatCircleSegment::IsOnArc(const SphereCoordinate& point, double tolerance) const {
    return IsOnArc(point.ToCartesian(), tolerance);
}

bool GreatCircleSegment::IsOnArc(const CartesianVector& point, double tolerance) const {
    CartesianVector unit = point.AsUnitVector();
    double startToPoint = CalculateArcLength(start_.ToCartesian(), unit);
    double endToPoint = CalculateArcLength(end_.ToCartesian(), unit);

    if (!IsZero(length_ - startToPoint - endToPoint, tolerance)) {
        return false;
    }
    if (HasAntipodalEnds()) {
        return baseCircle_.IsOnCircle(unit, tolerance);
    }
    return true;
}

CartesianVector GreatCircleSegment::GetTangentAt(const SphereCoordinate& point) const {
    return baseCircle_.GetTangentAt(point);
}

CartesianVector GreatCircleSegment::GetTangentAt(const SphereCoordinate& point,
                                                 const CartesianVector& direction) const {
    return baseCircle_.GetTangentAt(point, direction);
}

bool GreatCircleSegment::Intersects(const GreatCircleSegment& other,
                                    SphereCoordinate& intersection) const {
    Internal::SphereIntersectionResult result = Internal::IntersectArcs(*this, other);
    if (!result) {
        return false;
    }
    intersection = FromCartesian(result.point);
    return true;
}

} // namespace Sphere::Geom
