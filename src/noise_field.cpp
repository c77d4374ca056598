#include "noise_field.h"

#include <cmath>
#include <limits>
#include <stdexcept>

#include <glm/gtc/constants.hpp>

namespace {
// Cubic Hermite blend (3w^2 - 2w^3). First derivative is continuous at
// lattice boundaries, so heights stay smooth across chunk and world seams.
inline double smoothLerp(double a0, double a1, double w) {
    return (a1 - a0) * (3.0 - w * 2.0) * w * w + a0;
}

// Both corners of the lattice cell starting at `corner` must fit in int.
// NaN compares false and is rejected too.
inline bool latticeAddressable(double corner) {
    return corner >= static_cast<double>(std::numeric_limits<int>::min()) &&
           corner <= static_cast<double>(std::numeric_limits<int>::max() - 1);
}
} // namespace

NoiseField::NoiseField(uint32_t seed) : seed_(seed) {
}

glm::dvec2 NoiseField::gradientAt(int ix, int iy) {
    LatticeCoord key{ix, iy};
    auto it = gradients_.find(key);
    if (it != gradients_.end()) {
        return it->second;
    }

    double random = std::sin(ix * 12.9898 + iy * 78.233 + static_cast<double>(seed_)) * 43758.5453;
    double angle = (random - std::floor(random)) * glm::two_pi<double>();
    glm::dvec2 gradient(std::cos(angle), std::sin(angle));
    gradients_.emplace(key, gradient);
    return gradient;
}

double NoiseField::dotGridGradient(int ix, int iy, double x, double y) {
    glm::dvec2 gradient = gradientAt(ix, iy);
    double dx = x - static_cast<double>(ix);
    double dy = y - static_cast<double>(iy);
    return dx * gradient.x + dy * gradient.y;
}

double NoiseField::sampleAt(double x, double y) {
    const double fx = std::floor(x);
    const double fy = std::floor(y);
    if (!latticeAddressable(fx) || !latticeAddressable(fy)) {
        throw std::invalid_argument("sampleAt: coordinate is not finite or outside the int lattice");
    }

    SamplePoint key{x, y};
    auto it = samples_.find(key);
    if (it != samples_.end()) {
        return it->second;
    }

    int x0 = static_cast<int>(fx);
    int x1 = x0 + 1;
    int y0 = static_cast<int>(fy);
    int y1 = y0 + 1;

    double sx = x - static_cast<double>(x0);
    double sy = y - static_cast<double>(y0);

    double n0 = dotGridGradient(x0, y0, x, y);
    double n1 = dotGridGradient(x1, y0, x, y);
    double ix0 = smoothLerp(n0, n1, sx);

    double n2 = dotGridGradient(x0, y1, x, y);
    double n3 = dotGridGradient(x1, y1, x, y);
    double ix1 = smoothLerp(n2, n3, sx);

    double value = smoothLerp(ix0, ix1, sy);
    samples_.emplace(key, value);
    return value;
}

double NoiseField::octaveSample(double x, double y, int octaves, double persistence) {
    if (octaves < 1) {
        throw std::invalid_argument("octaveSample: octaves must be at least 1");
    }
    if (!(persistence > 0.0 && persistence <= 1.0)) {
        throw std::invalid_argument("octaveSample: persistence must lie in (0, 1]");
    }

    double total = 0.0;
    double frequency = 1.0;
    double amplitude = 1.0;
    double maxValue = 0.0;
    for (int i = 0; i < octaves; ++i) {
        total += sampleAt(x * frequency, y * frequency) * amplitude;
        maxValue += amplitude;
        amplitude *= persistence;
        frequency *= 2.0;
    }
    return total / maxValue;
}
