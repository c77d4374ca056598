#include "world.h"

#include <iostream>

World::World(const WorldConfig& config)
    : config_(config),
      noise_(config.seed),
      heightMap_(HeightMap::build(noise_, config.worldSize, config.octaves, config.persistence)),
      chunks_(heightMap_, registry_, meshSettings(config), config.renderDistance),
      player_(playerSettings(config),
              glm::vec3(config.worldSize / 2.0f, 0.0f, config.worldSize / 2.0f)),
      camera_(config.cameraDistance, config.cameraHeight) {
    player_.snapToGround(heightMap_);
    camera_.follow(player_.state());
    initialChunks_ = chunks_.ensureLoaded(player_.state().position);

    if (config_.verbose) {
        std::cout << "[World] seed " << config_.seed
                  << ", " << config_.worldSize << "x" << config_.worldSize
                  << " heights " << heightMap_.minHeight() << ".." << heightMap_.maxHeight()
                  << ", " << chunks_.chunkCount() << " chunks meshed" << std::endl;
    }
}

std::vector<ChunkCoord> World::update(float dt, InputIntent& input) {
    player_.advance(dt, input, heightMap_);
    camera_.follow(player_.state());
    return chunks_.ensureLoaded(player_.state().position);
}

ChunkMeshSettings World::meshSettings(const WorldConfig& config) {
    ChunkMeshSettings settings;
    settings.chunkSize = config.chunkSize;
    settings.voxelSize = config.voxelSize;
    return settings;
}

PlayerSettings World::playerSettings(const WorldConfig& config) {
    PlayerSettings settings;
    settings.worldSize = config.worldSize;
    settings.playerHeight = config.playerHeight;
    settings.moveSpeed = config.moveSpeed;
    settings.mouseSensitivity = config.mouseSensitivity;
    return settings;
}
