#pragma once

#include <cstddef>
#include <functional>
#include <optional>

#include <glm/glm.hpp>

#include "mesh.h"

struct ChunkCoord {
    int x = 0;
    int z = 0;

    bool operator==(const ChunkCoord& other) const noexcept {
        return x == other.x && z == other.z;
    }
    bool operator!=(const ChunkCoord& other) const noexcept {
        return !(*this == other);
    }
};

struct ChunkCoordHash {
    std::size_t operator()(const ChunkCoord& coord) const noexcept {
        return (static_cast<std::size_t>(coord.x) * 73856093u) ^ (static_cast<std::size_t>(coord.z) * 19349663u);
    }
};

namespace std {
    template <>
    struct hash<ChunkCoord> {
        std::size_t operator()(const ChunkCoord& coord) const noexcept {
            return ChunkCoordHash{}(coord);
        }
    };
}

// Floor division that also works for negative world coordinates.
inline int floorDiv(int value, int divisor) {
    int div = value / divisor;
    int rem = value % divisor;
    if ((rem != 0) && ((rem < 0) != (divisor < 0))) {
        --div;
    }
    return div;
}

// A meshed chunk. The surface is absent when the chunk produced no
// geometry; the record still exists so the chunk is never meshed again.
class Chunk {
public:
    Chunk(ChunkCoord coord, int size, std::optional<ChunkSurface> surface);

    Chunk(const Chunk&) = delete;
    Chunk& operator=(const Chunk&) = delete;

    Chunk(Chunk&& other) noexcept = default;
    Chunk& operator=(Chunk&& other) noexcept = default;

    ChunkCoord coord() const { return coord_; }
    glm::ivec3 worldOrigin() const { return glm::ivec3(coord_.x * size_, 0, coord_.z * size_); }

    bool empty() const { return !surface_.has_value(); }
    const ChunkSurface* surface() const { return surface_ ? &*surface_ : nullptr; }
    std::size_t vertexCount() const { return surface_ ? surface_->vertexCount() : 0; }

private:
    ChunkCoord coord_{};
    int size_ = 0;
    std::optional<ChunkSurface> surface_;
};
