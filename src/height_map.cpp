#include "height_map.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include "noise_field.h"

namespace {
// Projects each axis of the unit torus onto a circle of circumference 1:
// (cos, sin) of x in .xy, (cos, sin) of z in .zw.
glm::dvec4 torusEmbedding(double wx, double wz) {
    const double tau = glm::two_pi<double>();
    return glm::dvec4(std::cos(wx * tau) / tau,
                      std::sin(wx * tau) / tau,
                      std::cos(wz * tau) / tau,
                      std::sin(wz * tau) / tau);
}

// Noise value in [-1, 1] to a column height in [5, 25].
inline int heightFromNoise(double value) {
    return static_cast<int>(std::floor((value + 1.0) * 10.0)) + 5;
}
} // namespace

HeightMap::HeightMap(int size, std::vector<int> heights)
    : size_(size), heights_(std::move(heights)) {
    auto [lo, hi] = std::minmax_element(heights_.begin(), heights_.end());
    minHeight_ = *lo;
    maxHeight_ = *hi;
}

int HeightMap::columnHeight(NoiseField& noise, int x, int z, int size, int octaves, double persistence) {
    if (size <= 0) {
        throw std::invalid_argument("HeightMap: size must be positive");
    }
    double wx = static_cast<double>(wrap(x, size)) / size;
    double wz = static_cast<double>(wrap(z, size)) / size;
    glm::dvec4 n = torusEmbedding(wx, wz);

    // The 2D field only sees the x circle; nz/nw stay unused.
    double value = noise.octaveSample((n.x + 1.0) * kNoiseDomainScale,
                                      (n.y + 1.0) * kNoiseDomainScale,
                                      octaves,
                                      persistence);
    return heightFromNoise(value);
}

HeightMap HeightMap::build(NoiseField& noise, int size, int octaves, double persistence) {
    if (size <= 0) {
        throw std::invalid_argument("HeightMap: size must be positive");
    }
    std::vector<int> heights(static_cast<std::size_t>(size) * static_cast<std::size_t>(size));
    for (int z = 0; z < size; ++z) {
        for (int x = 0; x < size; ++x) {
            heights[static_cast<std::size_t>(z * size + x)] = columnHeight(noise, x, z, size, octaves, persistence);
        }
    }
    return HeightMap(size, std::move(heights));
}

HeightMap HeightMap::fromHeights(int size, std::vector<int> heights) {
    if (size <= 0) {
        throw std::invalid_argument("HeightMap: size must be positive");
    }
    if (heights.size() != static_cast<std::size_t>(size) * static_cast<std::size_t>(size)) {
        throw std::invalid_argument("HeightMap: expected size * size heights");
    }
    for (int h : heights) {
        if (h < 0) {
            throw std::invalid_argument("HeightMap: heights must not be negative");
        }
    }
    return HeightMap(size, std::move(heights));
}
