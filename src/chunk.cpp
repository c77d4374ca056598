#include "chunk.h"

#include <utility>

Chunk::Chunk(ChunkCoord coord, int size, std::optional<ChunkSurface> surface)
    : coord_(coord), size_(size), surface_(std::move(surface)) {
}
