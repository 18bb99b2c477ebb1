/**
 * @file GreatCircle.cpp
 * @brief Great circle construction, membership and tangents
 */

#include <SphereGeom/Geometry/GreatCircle.h>
#include <SphereGeom/Internal/SphereIntersection.h>

#include <limits>

namespace Sphere::Geom {

namespace {

CartesianVector PlaneNormal(const SphereCoordinate& a, const SphereCoordinate& b) {
    CartesianVector cross = a.ToCartesian().CrossProduct(b.ToCartesian());
    // Identical or antipodal points: rounding leaves a tiny arbitrary cross
    // product, which must not pass for a real circle
    if (cross.Length() <= EPSILON) {
        double nan = std::numeric_limits<double>::quiet_NaN();
        return {nan, nan, nan};
    }
    return cross.AsUnitVector();
}

} // anonymous namespace

GreatCircle::GreatCircle(const SphereCoordinate& a, const SphereCoordinate& b)
    : normal_(PlaneNormal(a, b)) {}

GreatCircle::GreatCircle(const CartesianVector& normal)
    : normal_(normal.AsUnitVector()) {}

bool GreatCircle::IsValid() const {
    return normal_.IsValid();
}

bool GreatCircle::IsOnCircle(const SphereCoordinate& point, double tolerance) const {
    return IsZero(point.ToCartesian().DotProduct(normal_), tolerance);
}

bool GreatCircle::IsOnCircle(const CartesianVector& point, double tolerance) const {
    return IsZero(point.AsUnitVector().DotProduct(normal_), tolerance);
}

CartesianVector GreatCircle::GetTangentAt(const SphereCoordinate& point) const {
    return normal_.CrossProduct(point.ToCartesian()).AsUnitVector();
}

CartesianVector GreatCircle::GetTangentAt(const SphereCoordinate& point,
                                          const CartesianVector& direction) const {
    CartesianVector tangent = GetTangentAt(point);
    if (tangent.DotProduct(direction) < 0.0) {
        return -tangent;
    }
    return tangent;
}

bool GreatCircle::Intersects(const GreatCircle& other, CartesianVector& point) const {
    Internal::SphereIntersectionResult result = Internal::IntersectGreatCircles(*this, other);
    if (!result) {
        return false;
    }
    point = result.point;
    return true;
}

} // namespace Sphere::Geom
