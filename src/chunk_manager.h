#pragma once

#include <memory>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>

#include "chunk.h"
#include "chunk_mesher.h"

class HeightMap;
class BlockRegistry;

// Decides which loaded chunks survive once the player's center chunk is
// known. Consulted after every ensureLoaded() for chunks outside the load
// window; chunks inside the window are never evicted.
class ChunkRetentionPolicy {
public:
    virtual ~ChunkRetentionPolicy() = default;
    virtual bool shouldRetain(const ChunkCoord& coord, const ChunkCoord& center) const = 0;
    virtual bool retainsEverything() const { return false; }
};

// Keeps every chunk for the process lifetime.
class RetainAllChunks : public ChunkRetentionPolicy {
public:
    bool shouldRetain(const ChunkCoord&, const ChunkCoord&) const override { return true; }
    bool retainsEverything() const override { return true; }
};

// Drops chunks farther than `radius` chunks (Chebyshev) from the center.
class DistanceRetention : public ChunkRetentionPolicy {
public:
    explicit DistanceRetention(int radius);
    bool shouldRetain(const ChunkCoord& coord, const ChunkCoord& center) const override;
    int radius() const { return radius_; }

private:
    int radius_ = 0;
};

class ChunkManager {
public:
    ChunkManager(const HeightMap& heightMap,
                 const BlockRegistry& registry,
                 ChunkMeshSettings settings,
                 int renderDistance);

    ChunkManager(const ChunkManager&) = delete;
    ChunkManager& operator=(const ChunkManager&) = delete;

    // Meshes every missing chunk inside the square window around the
    // player's chunk and returns the coordinates meshed by this call.
    // Window chunks whose voxels fall outside int range are skipped.
    std::vector<ChunkCoord> ensureLoaded(const glm::vec3& playerPosition);

    // Throws std::invalid_argument for non-finite positions or positions
    // outside int range.
    ChunkCoord chunkAt(const glm::vec3& position) const;

    const Chunk* find(const ChunkCoord& coord) const;
    bool contains(const ChunkCoord& coord) const { return chunks_.find(coord) != chunks_.end(); }
    int chunkCount() const { return static_cast<int>(chunks_.size()); }
    int renderDistance() const { return renderDistance_; }
    const std::unordered_map<ChunkCoord, std::unique_ptr<Chunk>>& chunks() const { return chunks_; }

    void setRetentionPolicy(std::unique_ptr<ChunkRetentionPolicy> policy);
    const std::vector<ChunkCoord>& lastEvicted() const { return lastEvicted_; }

private:
    void applyRetention(const ChunkCoord& center);
    bool insideWindow(const ChunkCoord& coord, const ChunkCoord& center) const;
    bool addressable(long long chunkX, long long chunkZ) const;

    const HeightMap& heightMap_;
    const BlockRegistry& registry_;
    ChunkMeshSettings settings_;
    int renderDistance_ = 6;

    std::unordered_map<ChunkCoord, std::unique_ptr<Chunk>> chunks_;
    std::unique_ptr<ChunkRetentionPolicy> retention_;
    std::vector<ChunkCoord> lastEvicted_;
};
