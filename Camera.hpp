#pragma once

#include "CommonHeader.hpp"

const glm::vec3 DEFAULT_CAM_POSITION(0.0f, 20.0f, 50.0f);
const glm::vec3 DEFAULT_CAM_TARGET(0.0f, 10.0f, 0.0f);
const float DEFAULT_FOV = 45.0f;

class Camera {
public:
    // Camera attributes
    glm::vec3 Position;
    glm::vec3 Target;
    glm::vec3 Front;
    glm::vec3 Up;
    glm::vec3 Right;
    glm::vec3 WorldUp;
    // Vertical field of view in degrees
    float Fov;

    // Constructor with the default preview pose.
    Camera(glm::vec3 position = DEFAULT_CAM_POSITION,
        glm::vec3 target = DEFAULT_CAM_TARGET,
        float fovDeg = DEFAULT_FOV,
        glm::vec3 worldUp = glm::vec3(0.0f, 1.0f, 0.0f));

    // Primary ray through the center of pixel (px, py); py = 0 is the top row.
    // Writes a normalized direction.
    void GenerateRay(uint32_t px, uint32_t py, uint32_t width, uint32_t height,
        glm::vec3& origin, glm::vec3& dir) const;

    // Re-aim at a new target keeping the position.
    void LookAt(const glm::vec3& target);

private:
    // Recalculate the front/right/up basis.
    void updateCameraVectors();
};
