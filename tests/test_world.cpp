/**
 * @file test_world.cpp
 * @brief Integration tests for the per-frame World update.
 */

#include <cassert>
#include <cmath>
#include <iostream>

#include "world.h"

namespace {
WorldConfig smallConfig() {
    WorldConfig config;
    config.seed = 42;
    config.worldSize = 64;
    config.renderDistance = 1;
    config.verbose = false;
    return config;
}
} // namespace

void test_startup() {
    std::cout << "Testing world start-up..." << std::endl;
    World world(smallConfig());

    assert(world.heightMap().size() == 64);
    assert(world.initialChunks().size() == 9);
    assert(world.chunkCount() == 9);
    assert(world.chunks().contains(ChunkCoord{2, 2}));

    const PlayerState& player = world.player();
    assert(player.position.x == 32.0f && player.position.z == 32.0f);
    assert(player.position.y == static_cast<float>(world.heightMap().at(32, 32)) + 0.9f);

    CameraPose expected = cameraPoseFor(player, world.config().cameraDistance, world.config().cameraHeight);
    assert(world.camera().position() == expected.position);
    assert(world.camera().target() == expected.target);
    std::cout << "  Start-up: PASS" << std::endl;
}

void test_idle_frames() {
    std::cout << "Testing idle frames..." << std::endl;
    World world(smallConfig());
    InputIntent input;
    for (int i = 0; i < 10; ++i) {
        assert(world.update(1.0f / 60.0f, input).empty());
    }
    assert(world.chunkCount() == 9);
    std::cout << "  Idle frames: PASS" << std::endl;
}

void test_walking_loads_chunks() {
    std::cout << "Testing chunk loading while walking..." << std::endl;
    World world(smallConfig());
    InputIntent input;
    input.forward = true;

    int created = 0;
    // 0.1s at 5 units/s: 20 frames walk 10 units north, across one chunk border.
    for (int i = 0; i < 20; ++i) {
        created += static_cast<int>(world.update(0.1f, input).size());

        const PlayerState& player = world.player();
        int cellX = static_cast<int>(std::floor(player.position.x));
        int cellZ = static_cast<int>(std::floor(player.position.z));
        assert(player.position.y == static_cast<float>(world.heightMap().at(cellX, cellZ)) + 0.9f);
        assert(world.camera().target() == player.position + glm::vec3(0.0f, 0.5f, 0.0f));
    }
    assert(std::abs(world.player().position.z - 22.0f) < 1e-3f);
    assert(created == 3);
    assert(world.chunkCount() == 12);
    assert(world.chunks().contains(ChunkCoord{2, 0}));
    assert(!world.chunks().contains(ChunkCoord{2, -1}));
    std::cout << "  Chunk loading while walking: PASS" << std::endl;
}

void test_walking_across_the_seam() {
    std::cout << "Testing the world seam..." << std::endl;
    World world(smallConfig());
    InputIntent input;
    input.forward = true;

    // 64 units north brings the player back to where it started.
    for (int i = 0; i < 128; ++i) {
        world.update(0.1f, input);
        assert(world.player().position.z >= 0.0f && world.player().position.z < 64.0f);
    }
    assert(std::abs(world.player().position.z - 32.0f) < 1e-2f);
    // Chunk keys are not wrapped: the window reached rows -1 through 4.
    assert(world.chunkCount() == 6 * 3);
    assert(world.chunks().contains(ChunkCoord{2, -1}));
    assert(world.chunks().contains(ChunkCoord{2, 4}));
    std::cout << "  World seam: PASS" << std::endl;
}

void test_long_frame_moves_full_distance() {
    std::cout << "Testing a long frame..." << std::endl;
    World world(smallConfig());
    InputIntent input;
    input.forward = true;

    // Half a second between frames still advances speed * dt.
    world.update(0.5f, input);
    assert(std::abs(world.player().position.z - 29.5f) < 1e-4f);
    assert(std::abs(world.player().velocity.z + 5.0f) < 1e-4f);
    std::cout << "  Long frame: PASS" << std::endl;
}

int main() {
    std::cout << "=== World Tests ===" << std::endl;

    test_startup();
    test_idle_frames();
    test_walking_loads_chunks();
    test_walking_across_the_seam();
    test_long_frame_moves_full_distance();

    std::cout << std::endl;
    std::cout << "All tests PASSED!" << std::endl;
    return 0;
}
