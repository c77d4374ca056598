#pragma once

#include <optional>

#include "chunk.h"
#include "mesh.h"

class HeightMap;
class BlockRegistry;

struct ChunkMeshSettings {
    int chunkSize = 16;
    float voxelSize = 1.0f;
    float sideShade = 0.8f; // side faces relative to the top color
};

// Meshes the chunkSize x chunkSize footprint of `coord`. Each voxel of a
// column gets a top quad; only the column's topmost voxel also gets its
// four side quads. Columns are sampled through HeightMap::at, so chunk
// coordinates outside the world read the wrapped heights while vertex
// positions stay in unwrapped world space.
//
// Returns std::nullopt when the chunk emits no vertices.
std::optional<ChunkSurface> meshChunk(const HeightMap& heightMap,
                                      ChunkCoord coord,
                                      const BlockRegistry& registry,
                                      const ChunkMeshSettings& settings);

// Closed axis-aligned box with the same face layout and winding as the
// terrain, used for the player avatar.
ChunkSurface cuboidSurface(const glm::vec3& minCorner,
                           const glm::vec3& extent,
                           const glm::vec3& color,
                           float sideShade);
