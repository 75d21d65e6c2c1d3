#pragma once
#include "CommonHeader.hpp"
#include "SphereSystem.hpp"
#include "Camera.hpp"
#include "BVH.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

/// Everything a scene file can set. Missing sections keep these defaults.
struct SceneConfig {
    /* raw values; BVHBuilder::setConfiguration clamps them */
    int maxLeafSize = (int)DEFAULT_MAX_LEAF_SIZE;
    int maxDepth = (int)DEFAULT_MAX_DEPTH;

    glm::vec3 cameraPosition = DEFAULT_CAM_POSITION;
    glm::vec3 cameraTarget = DEFAULT_CAM_TARGET;
    float     cameraFov = DEFAULT_FOV;

    uint32_t previewWidth = 320;
    uint32_t previewHeight = 240;

    /* explicit spheres first, then `randomCount` generated ones */
    std::vector<CPUSphere> spheres;
    uint32_t randomCount = 0;
    uint32_t randomSeed = 1234;

    /// Explicit spheres followed by the generated block.
    std::vector<CPUSphere> collectSpheres() const;
};

// Throws std::runtime_error naming the offending field.
SceneConfig parseSceneConfig(const nlohmann::json& root);

// Throws std::runtime_error if the file is missing or not valid JSON.
SceneConfig loadSceneConfig(const std::string& path);
