#pragma once

/**
 * @file SphereGeom.h
 * @brief Main header file for SphereGeom library
 *
 * SphereGeom provides geometric primitives on the unit sphere: Cartesian
 * vector algebra, spherical coordinates, great circles, great-circle arcs and
 * spherical polygon area. It is the substrate for spherical Voronoi
 * construction.
 *
 * @version 0.1.0
 */

// Configuration and export macros
#include <SphereGeom/SphereGeomConfig.h>
#include <SphereGeom/Core/Export.h>

// Core types and utilities
#include <SphereGeom/Core/Constants.h>
#include <SphereGeom/Core/Exception.h>
#include <SphereGeom/Core/Types.h>

// Geometry
#include <SphereGeom/Geometry/GreatCircle.h>
#include <SphereGeom/Geometry/GreatCircleSegment.h>
#include <SphereGeom/Geometry/SphericalPolygon.h>

namespace Sphere::Geom {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return SPHEREGEOM_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = SPHEREGEOM_VERSION_MAJOR;
    minor = SPHEREGEOM_VERSION_MINOR;
    patch = SPHEREGEOM_VERSION_PATCH;
}

} // namespace Sphere::Geom
