#include "camera.h"

#include <cmath>

#include <glm/gtc/matrix_transform.hpp>

#include "player.h"

CameraPose cameraPoseFor(const PlayerState& player, float distance, float height) {
    glm::vec3 offset(std::sin(player.heading) * distance * 0.5f,
                     height,
                     std::cos(player.heading) * distance);
    CameraPose pose;
    pose.position = player.position + offset;
    pose.target = player.position + glm::vec3(0.0f, 0.5f, 0.0f);
    return pose;
}

Camera::Camera() = default;

Camera::Camera(float distance, float height) : distance_(distance), height_(height) {
}

void Camera::setPerspective(float fovDeg, float aspect, float nearPlane, float farPlane) {
    fov_ = fovDeg;
    aspect_ = aspect;
    near_ = nearPlane;
    far_ = farPlane;
}

void Camera::setAspect(float aspect) {
    aspect_ = aspect;
}

void Camera::follow(const PlayerState& player) {
    pose_ = cameraPoseFor(player, distance_, height_);
}

glm::vec3 Camera::forward() const {
    glm::vec3 dir = pose_.target - pose_.position;
    if (glm::length(dir) < 1e-6f) {
        return glm::vec3(0.0f, 0.0f, -1.0f);
    }
    return glm::normalize(dir);
}

glm::mat4 Camera::viewMatrix() const {
    return glm::lookAt(pose_.position, pose_.target, worldUp_);
}

glm::mat4 Camera::projectionMatrix() const {
    return glm::perspective(glm::radians(fov_), aspect_, near_, far_);
}

glm::mat4 Camera::viewProjectionMatrix() const {
    return projectionMatrix() * viewMatrix();
}
