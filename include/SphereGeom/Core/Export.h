#pragma once

/**
 * @file Export.h
 * @brief Export/import macros for shared library support
 *
 * Build system should define one of:
 *   - SPHEREGEOM_BUILD_SHARED: when building SphereGeom as shared library
 *   - SPHEREGEOM_USE_SHARED: when using SphereGeom as shared library
 *   - SPHEREGEOM_STATIC: when building/using as static library (default)
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(SPHEREGEOM_BUILD_SHARED)
        #define SPHEREGEOM_API __declspec(dllexport)
    #elif defined(SPHEREGEOM_USE_SHARED)
        #define SPHEREGEOM_API __declspec(dllimport)
    #else
        #define SPHEREGEOM_API
    #endif
    #define SPHEREGEOM_CALL __cdecl
#else
    #if defined(SPHEREGEOM_BUILD_SHARED)
        #define SPHEREGEOM_API __attribute__((visibility("default")))
    #else
        #define SPHEREGEOM_API
    #endif
    #define SPHEREGEOM_CALL
#endif
