/**
 * @file Random.cpp
 * @brief Random number generation implementation
 */

#include <SphereGeom/Platform/Random.h>

#include <algorithm>
#include <chrono>
#include <functional>
#include <thread>

namespace Sphere::Geom::Platform {

Random& Random::Instance() {
    // Thread-local instance for thread safety
    thread_local Random instance;
    return instance;
}

Random::Random() {
    // Initialize with a combination of time and thread ID for uniqueness
    auto now = std::chrono::high_resolution_clock::now();
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
        now.time_since_epoch()).count();

    std::hash<std::thread::id> hasher;
    uint64_t threadHash = hasher(std::this_thread::get_id());

    seed_ = static_cast<uint64_t>(nanos) ^ threadHash;
    gen_.seed(seed_);
}

void Random::SetSeed(uint64_t seed) {
    seed_ = seed;
    gen_.seed(seed);

    // Drop cached state so the sequence depends on the seed only
    unitDist_.reset();
    normalDist_.reset();
}

// =========================================================================
// Scalars
// =========================================================================

int32_t Random::Int(int32_t min, int32_t max) {
    if (min > max) {
        std::swap(min, max);
    }
    std::uniform_int_distribution<int32_t> dist(min, max);
    return dist(gen_);
}

size_t Random::Index(size_t max) {
    if (max == 0) {
        return 0;
    }
    std::uniform_int_distribution<size_t> dist(0, max - 1);
    return dist(gen_);
}

double Random::Double() {
    return unitDist_(gen_);
}

double Random::Double(double min, double max) {
    if (min > max) {
        std::swap(min, max);
    }
    std::uniform_real_distribution<double> dist(min, max);
    return dist(gen_);
}

double Random::Gaussian() {
    return normalDist_(gen_);
}

double Random::Gaussian(double mean, double stddev) {
    return mean + stddev * normalDist_(gen_);
}

bool Random::Bool(double probabilityTrue) {
    if (probabilityTrue <= 0.0) return false;
    if (probabilityTrue >= 1.0) return true;
    return unitDist_(gen_) < probabilityTrue;
}

// =========================================================================
// Points on the Sphere
// =========================================================================

CartesianVector Random::UnitVector() {
    // A normal triple is rotation invariant; reject the (practically
    // impossible) near-zero draw before normalizing
    CartesianVector v;
    do {
        v = CartesianVector(normalDist_(gen_), normalDist_(gen_), normalDist_(gen_));
    } while (v.Length() < 1e-12);
    return v.AsUnitVector();
}

SphereCoordinate Random::Coordinate() {
    return FromCartesian(UnitVector());
}

} // namespace Sphere::Geom::Platform
