#include "Camera.hpp"

Camera::Camera(glm::vec3 position, glm::vec3 target, float fovDeg, glm::vec3 worldUp)
    : Position(position), Target(target), WorldUp(worldUp), Fov(fovDeg)
{
    updateCameraVectors();
}

void Camera::GenerateRay(uint32_t px, uint32_t py, uint32_t width, uint32_t height,
    glm::vec3& origin, glm::vec3& dir) const
{
    float aspect = float(width) / float(height);
    float tanHalf = std::tan(glm::radians(Fov) * 0.5f);

    /* NDC in [-1,1], y up */
    float u = (2.0f * (float(px) + 0.5f) / float(width) - 1.0f) * aspect * tanHalf;
    float v = (1.0f - 2.0f * (float(py) + 0.5f) / float(height)) * tanHalf;

    origin = Position;
    dir = glm::normalize(Front + u * Right + v * Up);
}

void Camera::LookAt(const glm::vec3& target)
{
    Target = target;
    updateCameraVectors();
}

void Camera::updateCameraVectors()
{
    Front = glm::normalize(Target - Position);
    Right = glm::normalize(glm::cross(Front, WorldUp));
    Up = glm::normalize(glm::cross(Right, Front));
}
