#include "chunk_manager.h"

#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <utility>

#include "height_map.h"
#include "voxel_block.h"

DistanceRetention::DistanceRetention(int radius) : radius_(radius) {
    if (radius < 0) {
        throw std::invalid_argument("DistanceRetention: radius must not be negative");
    }
}

bool DistanceRetention::shouldRetain(const ChunkCoord& coord, const ChunkCoord& center) const {
    int dx = coord.x - center.x;
    int dz = coord.z - center.z;
    return std::abs(dx) <= radius_ && std::abs(dz) <= radius_;
}

ChunkManager::ChunkManager(const HeightMap& heightMap,
                           const BlockRegistry& registry,
                           ChunkMeshSettings settings,
                           int renderDistance)
    : heightMap_(heightMap),
      registry_(registry),
      settings_(settings),
      renderDistance_(renderDistance),
      retention_(std::make_unique<RetainAllChunks>()) {
    if (settings_.chunkSize <= 0) {
        throw std::invalid_argument("ChunkManager: chunk size must be positive");
    }
    if (renderDistance_ < 0) {
        throw std::invalid_argument("ChunkManager: render distance must not be negative");
    }
}

ChunkCoord ChunkManager::chunkAt(const glm::vec3& position) const {
    const double fx = std::floor(static_cast<double>(position.x));
    const double fz = std::floor(static_cast<double>(position.z));
    const double lo = static_cast<double>(std::numeric_limits<int>::min());
    const double hi = static_cast<double>(std::numeric_limits<int>::max());
    if (!(fx >= lo && fx <= hi && fz >= lo && fz <= hi)) {
        throw std::invalid_argument("ChunkManager: position outside the addressable world");
    }
    int x = static_cast<int>(fx);
    int z = static_cast<int>(fz);
    return ChunkCoord{floorDiv(x, settings_.chunkSize), floorDiv(z, settings_.chunkSize)};
}

std::vector<ChunkCoord> ChunkManager::ensureLoaded(const glm::vec3& playerPosition) {
    ChunkCoord center = chunkAt(playerPosition);
    std::vector<ChunkCoord> created;
    for (int dz = -renderDistance_; dz <= renderDistance_; ++dz) {
        for (int dx = -renderDistance_; dx <= renderDistance_; ++dx) {
            long long chunkX = static_cast<long long>(center.x) + dx;
            long long chunkZ = static_cast<long long>(center.z) + dz;
            // Chunks whose voxels would leave int range have no key.
            if (!addressable(chunkX, chunkZ)) {
                continue;
            }
            ChunkCoord coord{static_cast<int>(chunkX), static_cast<int>(chunkZ)};
            if (chunks_.find(coord) != chunks_.end()) {
                continue;
            }
            auto chunk = std::make_unique<Chunk>(coord,
                                                 settings_.chunkSize,
                                                 meshChunk(heightMap_, coord, registry_, settings_));
            chunks_.emplace(coord, std::move(chunk));
            created.push_back(coord);
        }
    }
    applyRetention(center);
    return created;
}

const Chunk* ChunkManager::find(const ChunkCoord& coord) const {
    auto it = chunks_.find(coord);
    if (it == chunks_.end()) {
        return nullptr;
    }
    return it->second.get();
}

void ChunkManager::setRetentionPolicy(std::unique_ptr<ChunkRetentionPolicy> policy) {
    if (!policy) {
        policy = std::make_unique<RetainAllChunks>();
    }
    retention_ = std::move(policy);
}

void ChunkManager::applyRetention(const ChunkCoord& center) {
    lastEvicted_.clear();
    if (retention_->retainsEverything()) {
        return;
    }
    // The load window is always kept, whatever the policy says; otherwise
    // the next ensureLoaded() at the same spot would mesh it again.
    for (const auto& [coord, chunk] : chunks_) {
        if (insideWindow(coord, center)) {
            continue;
        }
        if (!retention_->shouldRetain(coord, center)) {
            lastEvicted_.push_back(coord);
        }
    }
    for (const auto& coord : lastEvicted_) {
        chunks_.erase(coord);
    }
}

bool ChunkManager::insideWindow(const ChunkCoord& coord, const ChunkCoord& center) const {
    long long dx = static_cast<long long>(coord.x) - center.x;
    long long dz = static_cast<long long>(coord.z) - center.z;
    return std::llabs(dx) <= renderDistance_ && std::llabs(dz) <= renderDistance_;
}

bool ChunkManager::addressable(long long chunkX, long long chunkZ) const {
    const long long size = settings_.chunkSize;
    auto fits = [size](long long c) {
        long long first = c * size;
        long long last = first + size - 1;
        return first >= std::numeric_limits<int>::min() && last <= std::numeric_limits<int>::max();
    };
    return fits(chunkX) && fits(chunkZ);
}
