#pragma once

#include <cstddef>
#include <vector>

class NoiseField;

// Immutable size x size grid of column heights, indexed [z][x]. Built once
// through a periodic embedding so opposite edges of the world line up.
class HeightMap {
public:
    static constexpr double kNoiseDomainScale = 100.0;

    static HeightMap build(NoiseField& noise, int size, int octaves, double persistence);

    // Wraps an existing [z][x] row-major grid; heights.size() must be size * size.
    static HeightMap fromHeights(int size, std::vector<int> heights);

    // Height of the column at integer (x, z) before any wrapping. x and
    // x + k * size map to the same noise-domain angle.
    static int columnHeight(NoiseField& noise, int x, int z, int size, int octaves, double persistence);

    static int wrap(int n, int size) { return ((n % size) + size) % size; }

    int at(int x, int z) const {
        return heights_[static_cast<std::size_t>(wrap(z, size_) * size_ + wrap(x, size_))];
    }

    int size() const { return size_; }
    int minHeight() const { return minHeight_; }
    int maxHeight() const { return maxHeight_; }

private:
    HeightMap(int size, std::vector<int> heights);

    int size_ = 0;
    int minHeight_ = 0;
    int maxHeight_ = 0;
    std::vector<int> heights_;
};
