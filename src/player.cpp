#include "player.h"

#include <cmath>
#include <stdexcept>

#include "height_map.h"

float wrapCoordinate(float value, float size) {
    float wrapped = std::fmod(std::fmod(value, size) + size, size);
    // A tiny negative input rounds up to exactly `size`.
    if (wrapped >= size) {
        wrapped -= size;
    }
    return wrapped;
}

PlayerController::PlayerController(PlayerSettings settings, const glm::vec3& start)
    : settings_(settings) {
    if (settings_.worldSize <= 0) {
        throw std::invalid_argument("PlayerController: world size must be positive");
    }
    state_.position = start;
}

glm::vec2 PlayerController::movementIntent(const InputIntent& input) {
    glm::vec2 move(0.0f); // (x, z); forward is -Z
    if (input.forward) move.y -= 1.0f;
    if (input.back) move.y += 1.0f;
    if (input.left) move.x -= 1.0f;
    if (input.right) move.x += 1.0f;
    if (glm::length(move) > 0.0f) {
        move = glm::normalize(move);
    }
    return move;
}

void PlayerController::advance(float dt, InputIntent& input, const HeightMap& heightMap) {
    if (dt < 0.0f) {
        dt = 0.0f;
    }

    if (input.lookActive) {
        state_.heading -= input.mouseDeltaX * settings_.mouseSensitivity;
    }
    input.mouseDeltaX = 0.0f;
    input.mouseDeltaY = 0.0f;

    glm::vec2 move = movementIntent(input);
    glm::vec2 step(0.0f);
    if (move.x != 0.0f || move.y != 0.0f) {
        float c = std::cos(state_.heading);
        float s = std::sin(state_.heading);
        glm::vec2 rotated(move.x * c - move.y * s, move.x * s + move.y * c);
        step = rotated * settings_.moveSpeed * dt;
        state_.position.x += step.x;
        state_.position.z += step.y;
    }
    state_.velocity = dt > 0.0f ? glm::vec3(step.x, 0.0f, step.y) / dt : glm::vec3(0.0f);

    snapToGround(heightMap);
}

void PlayerController::snapToGround(const HeightMap& heightMap) {
    const float size = static_cast<float>(settings_.worldSize);
    state_.position.x = wrapCoordinate(state_.position.x, size);
    state_.position.z = wrapCoordinate(state_.position.z, size);

    int cellX = static_cast<int>(std::floor(state_.position.x));
    int cellZ = static_cast<int>(std::floor(state_.position.z));
    state_.position.y = static_cast<float>(heightMap.at(cellX, cellZ)) + settings_.playerHeight / 2.0f;
}
