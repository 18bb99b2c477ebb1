#include <SphereGeom/Core/Types.h>
#include <SphereGeom/Core/Constants.h>

#include <cstdint>

namespace Sphere::Geom {

namespace {

// Index of the EPSILON-sized cell containing value
int64_t QuantizeComponent(double value) {
    double cell = std::round(value / EPSILON);
    if (std::abs(cell) < 9.0e18) {
        return static_cast<int64_t>(cell);
    }
    // Outside the grid range; fall back to the raw bits
    return static_cast<int64_t>(std::hash<double>()(value));
}

void HashCombine(size_t& seed, size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

} // anonymous namespace

// =============================================================================
// CartesianVector Implementation
// =============================================================================

size_t CartesianVector::Hash::operator()(const CartesianVector& v) const {
    std::hash<int64_t> hasher;
    size_t seed = hasher(QuantizeComponent(v.x));
    HashCombine(seed, hasher(QuantizeComponent(v.y)));
    HashCombine(seed, hasher(QuantizeComponent(v.z)));
    return seed;
}

// =============================================================================
// SphereCoordinate Implementation
// =============================================================================

CartesianVector SphereCoordinate::ToCartesian() const {
    return Sphere::Geom::ToCartesian(*this);
}

SphereCoordinate SphereCoordinate::FromCartesian(const CartesianVector& v) {
    return Sphere::Geom::FromCartesian(v);
}

bool SphereCoordinate::operator==(const SphereCoordinate& other) const {
    return Sphere::Geom::ToCartesian(*this) == Sphere::Geom::ToCartesian(other);
}

// =============================================================================
// Conversions
// =============================================================================

CartesianVector ToCartesian(const SphereCoordinate& coord) {
    // Axis order differs from the textbook formula: Y is the polar axis
    double sinTheta = std::sin(coord.theta);
    return {sinTheta * std::sin(coord.phi),
            std::cos(coord.theta),
            sinTheta * std::cos(coord.phi)};
}

SphereCoordinate FromCartesian(const CartesianVector& v) {
    CartesianVector unit = v.AsUnitVector();
    double theta = std::acos(Clamp(unit.y, -1.0, 1.0));
    double phi = NormalizeAngle0To2PI(std::atan2(unit.x, unit.z));
    return {theta, phi};
}

} // namespace Sphere::Geom
