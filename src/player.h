#pragma once

#include <glm/glm.hpp>

class HeightMap;

// Snapshot of held movement keys plus pointer motion accumulated since it
// was last consumed by PlayerController::advance.
struct InputIntent {
    bool forward = false;
    bool back = false;
    bool left = false;
    bool right = false;
    bool lookActive = false;
    float mouseDeltaX = 0.0f;
    float mouseDeltaY = 0.0f;
};

struct PlayerState {
    glm::vec3 position{0.0f};
    float heading = 0.0f; // radians around +Y, unbounded
    glm::vec3 velocity{0.0f};
};

struct PlayerSettings {
    int worldSize = 256;
    float playerHeight = 1.8f;
    float moveSpeed = 5.0f;
    float mouseSensitivity = 0.002f;
};

// Wraps a continuous coordinate into [0, size).
float wrapCoordinate(float value, float size);

class PlayerController {
public:
    explicit PlayerController(PlayerSettings settings, const glm::vec3& start = glm::vec3(0.0f));

    // One tick: mouse look, planar movement relative to heading, wrap at the
    // world edge, then snap to the ground. Consumes the pointer deltas.
    void advance(float dt, InputIntent& input, const HeightMap& heightMap);

    // Places the player on the ground at its current (wrapped) x/z.
    void snapToGround(const HeightMap& heightMap);

    const PlayerState& state() const { return state_; }
    const PlayerSettings& settings() const { return settings_; }

    static glm::vec2 movementIntent(const InputIntent& input);

private:
    PlayerSettings settings_;
    PlayerState state_;
};
