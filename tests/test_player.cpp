/**
 * @file test_player.cpp
 * @brief Unit tests for PlayerController and the camera rig.
 */

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

#include <glm/gtc/constants.hpp>

#include "camera.h"
#include "height_map.h"
#include "player.h"

namespace {
constexpr int kSize = 16;

HeightMap bumpyWorld() {
    std::vector<int> heights(kSize * kSize);
    for (int z = 0; z < kSize; ++z) {
        for (int x = 0; x < kSize; ++x) {
            heights[static_cast<std::size_t>(z * kSize + x)] = 5 + (3 * x + z) % 7;
        }
    }
    return HeightMap::fromHeights(kSize, heights);
}

PlayerSettings settingsFor(int size) {
    PlayerSettings settings;
    settings.worldSize = size;
    return settings;
}

bool closeTo(float a, float b, float eps = 1e-4f) {
    return std::abs(a - b) < eps;
}

void assertGrounded(const PlayerState& state, const HeightMap& map, float playerHeight) {
    int cellX = static_cast<int>(std::floor(state.position.x));
    int cellZ = static_cast<int>(std::floor(state.position.z));
    assert(state.position.x >= 0.0f && state.position.x < static_cast<float>(map.size()));
    assert(state.position.z >= 0.0f && state.position.z < static_cast<float>(map.size()));
    assert(state.position.y == static_cast<float>(map.at(cellX, cellZ)) + playerHeight / 2.0f);
}
} // namespace

void test_wrap_coordinate() {
    std::cout << "Testing wrapCoordinate..." << std::endl;
    assert(wrapCoordinate(0.0f, 16.0f) == 0.0f);
    assert(closeTo(wrapCoordinate(17.5f, 16.0f), 1.5f));
    assert(closeTo(wrapCoordinate(-0.5f, 16.0f), 15.5f));
    assert(closeTo(wrapCoordinate(-33.0f, 16.0f), 15.0f));
    float tiny = wrapCoordinate(-1e-7f, 16.0f);
    assert(tiny >= 0.0f && tiny < 16.0f);
    float big = wrapCoordinate(1e6f + 0.25f, 256.0f);
    assert(big >= 0.0f && big < 256.0f);
    std::cout << "  wrapCoordinate: PASS" << std::endl;
}

void test_movement_intent() {
    std::cout << "Testing movement intent..." << std::endl;
    InputIntent input;
    assert(PlayerController::movementIntent(input) == glm::vec2(0.0f));

    input.forward = true;
    assert(PlayerController::movementIntent(input) == glm::vec2(0.0f, -1.0f));

    input.right = true;
    glm::vec2 diagonal = PlayerController::movementIntent(input);
    assert(closeTo(glm::length(diagonal), 1.0f));
    assert(diagonal.x > 0.0f && diagonal.y < 0.0f);

    // Opposing keys cancel.
    input.back = true;
    input.right = false;
    assert(PlayerController::movementIntent(input) == glm::vec2(0.0f));
    std::cout << "  Movement intent: PASS" << std::endl;
}

void test_diagonal_speed() {
    std::cout << "Testing diagonal speed..." << std::endl;
    HeightMap map = bumpyWorld();
    PlayerSettings settings = settingsFor(kSize);
    PlayerController player(settings, glm::vec3(8.5f, 0.0f, 8.5f));

    InputIntent input;
    input.forward = true;
    input.right = true;
    const float dt = 0.1f;
    glm::vec3 before = player.state().position;
    player.advance(dt, input, map);
    glm::vec3 after = player.state().position;

    float moved = glm::length(glm::vec2(after.x - before.x, after.z - before.z));
    assert(closeTo(moved, settings.moveSpeed * dt));
    assert(closeTo(glm::length(player.state().velocity), settings.moveSpeed));
    std::cout << "  Diagonal speed: PASS" << std::endl;
}

void test_heading_rotates_movement() {
    std::cout << "Testing heading..." << std::endl;
    HeightMap map = bumpyWorld();
    PlayerController player(settingsFor(kSize), glm::vec3(8.5f, 0.0f, 8.5f));

    InputIntent input;
    input.forward = true;
    player.advance(0.1f, input, map);
    assert(closeTo(player.state().position.x, 8.5f));
    assert(closeTo(player.state().position.z, 8.0f));

    // Turn a quarter to the right: dragging left by (pi/2)/sensitivity.
    InputIntent look;
    look.lookActive = true;
    look.mouseDeltaX = -glm::half_pi<float>() / 0.002f;
    player.advance(0.0f, look, map);
    assert(closeTo(player.state().heading, glm::half_pi<float>()));
    assert(look.mouseDeltaX == 0.0f);

    player.advance(0.1f, input, map);
    assert(closeTo(player.state().position.x, 9.0f));
    assert(closeTo(player.state().position.z, 8.0f));
    std::cout << "  Heading: PASS" << std::endl;
}

void test_mouse_delta_consumed() {
    std::cout << "Testing mouse delta consumption..." << std::endl;
    HeightMap map = bumpyWorld();
    PlayerController player(settingsFor(kSize), glm::vec3(2.0f, 0.0f, 2.0f));

    InputIntent input;
    input.lookActive = true;
    input.mouseDeltaX = 100.0f;
    input.mouseDeltaY = 40.0f;
    player.advance(0.016f, input, map);
    assert(closeTo(player.state().heading, -0.2f));
    assert(input.mouseDeltaX == 0.0f);
    assert(input.mouseDeltaY == 0.0f);

    // A second tick without new motion does not turn again.
    player.advance(0.016f, input, map);
    assert(closeTo(player.state().heading, -0.2f));

    // Motion while look is inactive is dropped, not deferred.
    input.lookActive = false;
    input.mouseDeltaX = 500.0f;
    player.advance(0.016f, input, map);
    assert(closeTo(player.state().heading, -0.2f));
    assert(input.mouseDeltaX == 0.0f);
    input.lookActive = true;
    player.advance(0.016f, input, map);
    assert(closeTo(player.state().heading, -0.2f));
    std::cout << "  Mouse delta consumption: PASS" << std::endl;
}

void test_wrap_at_world_edge() {
    std::cout << "Testing world edge wrap..." << std::endl;
    HeightMap map = bumpyWorld();
    PlayerController player(settingsFor(kSize), glm::vec3(15.9f, 0.0f, 0.1f));

    InputIntent input;
    input.right = true;
    player.advance(0.1f, input, map);
    assert(closeTo(player.state().position.x, 0.4f));
    assertGrounded(player.state(), map, 1.8f);

    input.right = false;
    input.forward = true;
    player.advance(0.1f, input, map);
    assert(closeTo(player.state().position.z, 15.6f));
    assertGrounded(player.state(), map, 1.8f);
    std::cout << "  World edge wrap: PASS" << std::endl;
}

void test_ground_clamp() {
    std::cout << "Testing ground clamp..." << std::endl;
    HeightMap map = bumpyWorld();
    PlayerController player(settingsFor(kSize), glm::vec3(3.0f, 100.0f, 3.0f));
    player.snapToGround(map);
    assertGrounded(player.state(), map, 1.8f);

    InputIntent input;
    for (int i = 0; i < 400; ++i) {
        input.forward = (i % 3) != 0;
        input.left = (i % 5) < 2;
        input.back = (i % 11) == 0;
        input.lookActive = true;
        input.mouseDeltaX = static_cast<float>((i % 7) - 3) * 20.0f;
        player.advance(1.0f / 60.0f, input, map);
        assertGrounded(player.state(), map, 1.8f);
    }

    // Negative time never moves the player.
    glm::vec3 before = player.state().position;
    input = InputIntent{};
    input.forward = true;
    player.advance(-1.0f, input, map);
    assert(player.state().position == before);
    std::cout << "  Ground clamp: PASS" << std::endl;
}

void test_camera_pose() {
    std::cout << "Testing camera pose..." << std::endl;
    PlayerState state;
    state.position = glm::vec3(10.0f, 7.0f, 20.0f);
    state.heading = 0.0f;

    CameraPose pose = cameraPoseFor(state, 5.0f, 2.0f);
    assert(closeTo(pose.position.x, 10.0f));
    assert(closeTo(pose.position.y, 9.0f));
    assert(closeTo(pose.position.z, 25.0f));
    assert(pose.target == glm::vec3(10.0f, 7.5f, 20.0f));

    state.heading = glm::half_pi<float>();
    pose = cameraPoseFor(state, 5.0f, 2.0f);
    assert(closeTo(pose.position.x, 12.5f));
    assert(closeTo(pose.position.y, 9.0f));
    assert(closeTo(pose.position.z, 20.0f));

    Camera camera(5.0f, 2.0f);
    camera.follow(state);
    assert(camera.position() == pose.position);
    assert(camera.target() == pose.target);
    assert(closeTo(glm::length(camera.forward()), 1.0f));

    // The target sits in front of the camera in view space.
    glm::vec4 viewTarget = camera.viewMatrix() * glm::vec4(pose.target, 1.0f);
    assert(viewTarget.z < 0.0f);
    std::cout << "  Camera pose: PASS" << std::endl;
}

void test_invalid_settings() {
    std::cout << "Testing invalid settings..." << std::endl;
    bool threw = false;
    try {
        PlayerController player(settingsFor(0));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "  Invalid settings: PASS" << std::endl;
}

int main() {
    std::cout << "=== Player and Camera Tests ===" << std::endl;

    test_wrap_coordinate();
    test_movement_intent();
    test_diagonal_speed();
    test_heading_rotates_movement();
    test_mouse_delta_consumed();
    test_wrap_at_world_edge();
    test_ground_clamp();
    test_camera_pose();
    test_invalid_settings();

    std::cout << std::endl;
    std::cout << "All tests PASSED!" << std::endl;
    return 0;
}
