/**
 * @file great_circle_demo.cpp
 * @brief 示例：大圆弧与球面多边形 / Example: Great-circle arcs and spherical polygons
 */

#include <SphereGeom/SphereGeom.h>
#include <cstdio>

using namespace Sphere::Geom;

namespace {

void PrintVector(const char* label, const CartesianVector& v) {
    printf("   %-28s Cartesian: %.6f / %.6f / %.6f\n", label, v.x, v.y, v.z);
}

void PrintCoordinate(const char* label, const SphereCoordinate& c) {
    printf("   %-28s Spherical: theta=%.6f phi=%.6f\n", label, c.theta, c.phi);
}

} // anonymous namespace

int main() {
    printf("=== SphereGeom Sample: Great Circles (v%s) ===\n\n", GetVersion());

    // 1. 坐标转换 / Coordinate conversion
    printf("1. Arc endpoints:\n");
    SphereCoordinate start1(HALF_PI, 1.75 * PI);
    SphereCoordinate end1(HALF_PI, QUARTER_PI);
    SphereCoordinate start2(QUARTER_PI, 0.0);
    SphereCoordinate end2(0.75 * PI, 0.0);
    PrintVector("start1", start1.ToCartesian());
    PrintVector("end1", end1.ToCartesian());
    PrintVector("start2", start2.ToCartesian());
    PrintVector("end2", end2.ToCartesian());

    GreatCircleSegment arc1(start1, end1);
    GreatCircleSegment arc2(start2, end2);

    // 2. 弧中点 / Arc midpoint
    printf("\n2. Midpoint of arc1 (length %.6f):\n", arc1.Length());
    CartesianVector midpoint = arc1.Midpoint();
    PrintVector("midpoint", midpoint);
    PrintVector("expected", CartesianVector(0.0, 0.0, 2.0).AsUnitVector());
    PrintCoordinate("midpoint", FromCartesian(midpoint));
    PrintCoordinate("expected", FromCartesian(CartesianVector(0.0, 0.0, 2.0)));
    PrintVector("midpoint round trip", FromCartesian(midpoint).ToCartesian());

    // 3. 弧相交 / Arc intersection
    printf("\n3. Intersection of arc1 and arc2:\n");
    SphereCoordinate intersection;
    if (arc1.Intersects(arc2, intersection)) {
        PrintCoordinate("intersection", intersection);
        PrintVector("intersection", intersection.ToCartesian());
    } else {
        printf("   Arcs do not intersect.\n");
    }

    // 4. 球面多边形面积 / Spherical polygon area
    printf("\n4. Quarter sphere polygon:\n");
    SphericalPolygon quarterSphere({
        {0.0, 0.0},
        {HALF_PI, 0.0},
        {HALF_PI, HALF_PI},
        {HALF_PI, PI}
    });
    printf("   Size of quarter sphere polygon: %.6f\n", quarterSphere.Area());
    printf("   Area of whole sphere:           %.6f\n", SPHERE_AREA);
    printf("   Area of quarter sphere:         %.6f\n", SPHERE_AREA / 4.0);

    printf("\n=== Sample Complete ===\n");
    return 0;
}
