#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_map>

#include <glm/glm.hpp>

struct LatticeCoord {
    int x = 0;
    int y = 0;

    bool operator==(const LatticeCoord& other) const noexcept {
        return x == other.x && y == other.y;
    }
};

struct LatticeCoordHash {
    std::size_t operator()(const LatticeCoord& coord) const noexcept {
        return (static_cast<std::size_t>(coord.x) * 73856093u) ^ (static_cast<std::size_t>(coord.y) * 19349663u);
    }
};

// Exact input pair of a noise sample. -0.0 and +0.0 are the same key.
struct SamplePoint {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const SamplePoint& other) const noexcept {
        return x == other.x && y == other.y;
    }
};

struct SamplePointHash {
    std::size_t operator()(const SamplePoint& point) const noexcept {
        // Adding 0.0 folds -0.0 into +0.0 so equal keys hash equally.
        std::size_t hx = std::hash<double>{}(point.x + 0.0);
        std::size_t hy = std::hash<double>{}(point.y + 0.0);
        return hx ^ (hy + 0x9e3779b97f4a7c15ull + (hx << 6) + (hx >> 2));
    }
};

// Seeded 2D gradient noise. Gradients and single-octave samples are
// memoized for the lifetime of the field; both caches only grow.
class NoiseField {
public:
    explicit NoiseField(uint32_t seed);

    NoiseField(const NoiseField&) = delete;
    NoiseField& operator=(const NoiseField&) = delete;
    NoiseField(NoiseField&&) = default;
    NoiseField& operator=(NoiseField&&) = default;

    glm::dvec2 gradientAt(int ix, int iy);
    // Throws std::invalid_argument when x or y is not finite or its lattice
    // cell lies outside int range.
    double sampleAt(double x, double y);
    double octaveSample(double x, double y, int octaves, double persistence);

    uint32_t seed() const { return seed_; }
    std::size_t gradientCacheSize() const { return gradients_.size(); }
    std::size_t sampleCacheSize() const { return samples_.size(); }

private:
    double dotGridGradient(int ix, int iy, double x, double y);

    uint32_t seed_ = 0;
    std::unordered_map<LatticeCoord, glm::dvec2, LatticeCoordHash> gradients_;
    std::unordered_map<SamplePoint, double, SamplePointHash> samples_;
};
