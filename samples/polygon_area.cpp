/**
 * @file polygon_area.cpp
 * @brief 示例：球面三角形面积统计 / Example: Random spherical triangle areas
 *
 * Draws random triangles on the unit sphere and compares the spherical excess
 * area with the solid angle formula
 * tan(E / 2) = a.(b x c) / (1 + a.b + b.c + c.a).
 */

#include <SphereGeom/SphereGeom.h>
#include <SphereGeom/Platform/Random.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>

using namespace Sphere::Geom;

int main(int argc, char** argv) {
    int count = argc > 1 ? std::atoi(argv[1]) : 1000;
    if (count <= 0) {
        fprintf(stderr, "usage: %s [triangle count > 0]\n", argv[0]);
        return 1;
    }

    printf("=== SphereGeom Sample: Random Triangle Areas ===\n\n");
    Platform::SetRandomSeed(42);

    double maxError = 0.0;
    double totalArea = 0.0;
    for (int i = 0; i < count; ++i) {
        CartesianVector a = Platform::RandomUnitVector();
        CartesianVector b = Platform::RandomUnitVector();
        CartesianVector c = Platform::RandomUnitVector();

        SphericalPolygon triangle({FromCartesian(a), FromCartesian(b), FromCartesian(c)});
        double area = triangle.Area();

        double triple = a.DotProduct(b.CrossProduct(c));
        double denom = 1.0 + a.DotProduct(b) + b.DotProduct(c) + c.DotProduct(a);
        double solidAngle = std::abs(2.0 * std::atan2(triple, denom));
        double reference = std::min(solidAngle, SPHERE_AREA - solidAngle);

        maxError = std::max(maxError, std::abs(area - reference));
        totalArea += area;
    }

    printf("   Triangles:        %d\n", count);
    printf("   Mean area:        %.6f sr\n", totalArea / count);
    printf("   Max |difference|: %.3e sr\n", maxError);

    printf("\n=== Sample Complete ===\n");
    return 0;
}
