#pragma once

/**
 * @file SphereIntersection.h
 * @brief Intersections between great circles and great-circle arcs
 *
 * This module provides:
 * - Circle-Circle intersection (antipodal point pair)
 * - Arc-Arc intersection (antipodal disambiguation by arc containment)
 *
 * Used by:
 * - Geometry/GreatCircle::Intersects
 * - Geometry/GreatCircleSegment::Intersects
 *
 * Design principles:
 * - All functions are pure (no global state)
 * - "No intersection" is a normal result, never an exception
 * - Both antipodal candidates are always tested; formula sign conventions
 *   are never relied on
 */

#include <SphereGeom/Core/Types.h>
#include <SphereGeom/Core/Constants.h>
#include <SphereGeom/Geometry/GreatCircle.h>
#include <SphereGeom/Geometry/GreatCircleSegment.h>

namespace Sphere::Geom::Internal {

// =============================================================================
// Constants
// =============================================================================

/// |n1 x n2| below this means the circles coincide
constexpr double COINCIDENT_NORMAL_TOLERANCE = EPSILON;

// =============================================================================
// Result Structures
// =============================================================================

/**
 * @brief Result of a sphere intersection
 *
 * For circle-circle results @c point is one intersection and @c antipode the
 * other. For arc-arc results @c point is the single point on both arcs.
 */
struct SphereIntersectionResult {
    bool exists = false;
    CartesianVector point;
    CartesianVector antipode;

    operator bool() const { return exists; }

    static SphereIntersectionResult None() { return SphereIntersectionResult{}; }

    static SphereIntersectionResult At(const CartesianVector& p) {
        SphereIntersectionResult r;
        r.exists = true;
        r.point = p;
        r.antipode = -p;
        return r;
    }
};

// =============================================================================
// Circle-Circle
// =============================================================================

/**
 * @brief Intersect two great circles
 *
 * @return point = (n1 x n2) normalized, antipode = -point; no intersection if
 *         the circles coincide or either is degenerate
 */
SphereIntersectionResult IntersectGreatCircles(const GreatCircle& c1, const GreatCircle& c2);

/**
 * @brief Check if two great circles are the same circle
 *
 * True when the normals are parallel or anti-parallel within tolerance.
 */
bool AreCirclesCoincident(const GreatCircle& c1, const GreatCircle& c2,
                          double tolerance = COINCIDENT_NORMAL_TOLERANCE);

// =============================================================================
// Arc-Arc
// =============================================================================

/**
 * @brief Intersect two great-circle arcs
 *
 * Zero-length arcs never intersect. Otherwise the base circle intersection
 * and its antipode are tested against both arcs; the first candidate on both
 * arcs is returned.
 */
SphereIntersectionResult IntersectArcs(const GreatCircleSegment& a1, const GreatCircleSegment& a2);

} // namespace Sphere::Geom::Internal
