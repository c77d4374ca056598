#pragma once

#include <glm/glm.hpp>

struct PlayerState;

struct CameraPose {
    glm::vec3 position{0.0f};
    glm::vec3 target{0.0f};
};

// Over-the-shoulder pose rigidly attached to the player: behind by
// `distance`, shifted sideways by half of it, raised by `height`, looking
// at a point 0.5 above the player.
CameraPose cameraPoseFor(const PlayerState& player, float distance, float height);

class Camera {
public:
    Camera();
    Camera(float distance, float height);

    void setPerspective(float fovDeg, float aspect, float nearPlane, float farPlane);
    void setAspect(float aspect);

    void follow(const PlayerState& player);

    glm::mat4 viewMatrix() const;
    glm::mat4 projectionMatrix() const;
    glm::mat4 viewProjectionMatrix() const;

    const CameraPose& pose() const { return pose_; }
    const glm::vec3& position() const { return pose_.position; }
    const glm::vec3& target() const { return pose_.target; }
    glm::vec3 forward() const;

private:
    CameraPose pose_{};
    glm::vec3 worldUp_{0.0f, 1.0f, 0.0f};

    float distance_ = 5.0f;
    float height_ = 2.0f;
    float fov_ = 75.0f;
    float aspect_ = 16.0f / 9.0f;
    float near_ = 0.1f;
    float far_ = 1000.0f;
};
