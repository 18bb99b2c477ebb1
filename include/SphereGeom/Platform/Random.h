#pragma once

/**
 * @file Random.h
 * @brief Random number and random point generation
 *
 * Provides thread-safe random generation for:
 * - Property tests over random points on the sphere
 * - Sample programs
 */

#include <SphereGeom/Core/Export.h>
#include <SphereGeom/Core/Types.h>

#include <cstddef>
#include <cstdint>
#include <random>

namespace Sphere::Geom::Platform {

/**
 * @brief Thread-safe random number generator
 *
 * Uses MT19937-64. Each thread has its own generator instance.
 */
class SPHEREGEOM_API Random {
public:
    /**
     * @brief Get thread-local random instance
     */
    static Random& Instance();

    /**
     * @brief Reseed the current thread's generator
     */
    void SetSeed(uint64_t seed);

    /**
     * @brief Get current seed (for debugging)
     */
    uint64_t GetSeed() const { return seed_; }

    // =========================================================================
    // Scalars
    // =========================================================================

    /// Random integer in [min, max] (inclusive)
    int32_t Int(int32_t min, int32_t max);

    /// Random index in [0, max)
    size_t Index(size_t max);

    /// Random double in [0, 1)
    double Double();

    /// Random double in [min, max)
    double Double(double min, double max);

    /// Standard normal N(0, 1)
    double Gaussian();

    /// Normal N(mean, stddev)
    double Gaussian(double mean, double stddev);

    /// Random boolean with given probability of true
    bool Bool(double probabilityTrue = 0.5);

    // =========================================================================
    // Points on the Sphere
    // =========================================================================

    /**
     * @brief Unit vector uniformly distributed over the sphere
     *
     * Normalized triple of independent standard normals.
     */
    CartesianVector UnitVector();

    /**
     * @brief Angular form of UnitVector()
     */
    SphereCoordinate Coordinate();

    /// Underlying generator (for use with STL distributions)
    std::mt19937_64& Generator() { return gen_; }

private:
    Random();
    Random(const Random&) = delete;
    Random& operator=(const Random&) = delete;

    std::mt19937_64 gen_;
    uint64_t seed_;

    std::uniform_real_distribution<double> unitDist_{0.0, 1.0};
    std::normal_distribution<double> normalDist_{0.0, 1.0};
};

// =========================================================================
// Convenience Free Functions
// =========================================================================

inline double RandomDouble(double min, double max) {
    return Random::Instance().Double(min, max);
}

inline CartesianVector RandomUnitVector() {
    return Random::Instance().UnitVector();
}

inline SphereCoordinate RandomSphereCoordinate() {
    return Random::Instance().Coordinate();
}

inline void SetRandomSeed(uint64_t seed) {
    Random::Instance().SetSeed(seed);
}

} // namespace Sphere::Geom::Platform
