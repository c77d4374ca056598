#pragma once

#include <cstdint>

struct WorldConfig {
    uint32_t seed = 12345;

    int worldSize = 256;
    int chunkSize = 16;
    float voxelSize = 1.0f;
    int renderDistance = 6; // chunks, Chebyshev radius

    // Terrain
    int octaves = 4;
    double persistence = 0.5;

    // Player
    float playerHeight = 1.8f;
    float playerRadius = 0.4f;
    float moveSpeed = 5.0f;        // units per second
    float mouseSensitivity = 0.002f;

    // Camera
    float cameraDistance = 5.0f;
    float cameraHeight = 2.0f;

    bool verbose = true;
};
