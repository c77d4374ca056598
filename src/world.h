#pragma once

#include <vector>

#include <glm/glm.hpp>

#include "camera.h"
#include "chunk_manager.h"
#include "height_map.h"
#include "noise_field.h"
#include "player.h"
#include "voxel_block.h"
#include "world_config.h"

// Whole simulation state. The host owns one World and calls update() once
// per frame; nothing here is global.
class World {
public:
    explicit World(const WorldConfig& config);

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    // advance player -> update camera -> ensure chunks loaded.
    // Returns the chunks meshed during this frame.
    std::vector<ChunkCoord> update(float dt, InputIntent& input);

    const WorldConfig& config() const { return config_; }
    const HeightMap& heightMap() const { return heightMap_; }
    const BlockRegistry& registry() const { return registry_; }
    const ChunkManager& chunks() const { return chunks_; }
    ChunkManager& chunks() { return chunks_; }
    const PlayerState& player() const { return player_.state(); }
    const Camera& camera() const { return camera_; }
    Camera& camera() { return camera_; }

    int chunkCount() const { return chunks_.chunkCount(); }
    int renderDistance() const { return chunks_.renderDistance(); }

    // Chunks meshed while constructing the world.
    const std::vector<ChunkCoord>& initialChunks() const { return initialChunks_; }

private:
    static ChunkMeshSettings meshSettings(const WorldConfig& config);
    static PlayerSettings playerSettings(const WorldConfig& config);

    WorldConfig config_;
    BlockRegistry registry_;
    NoiseField noise_;
    HeightMap heightMap_;
    ChunkManager chunks_;
    PlayerController player_;
    Camera camera_;
    std::vector<ChunkCoord> initialChunks_;
};
