#pragma once
#include <vector>
#include <cstdint>

/**
 * CPUSphere: one sphere exactly as the compute shader reads it,
 * 8 floats per record. The BVH only looks at center and radius.
 */
struct CPUSphere
{
    float centerX, centerY, centerZ;
    float radius;
    float colorR, colorG, colorB;
    float metallic;
};
static_assert(sizeof(CPUSphere) == 8 * sizeof(float), "sphere record must stay 8 floats");

/** Flatten spheres into the 8-floats-per-sphere GPU buffer, input order kept. */
std::vector<float> packSphereBuffer(const std::vector<CPUSphere>& spheres);

/** Inverse of packSphereBuffer for the first `count` records. */
std::vector<CPUSphere> unpackSphereBuffer(const std::vector<float>& data, uint32_t count);

/**
 * Generate a random test scene of `count` spheres inside the default view
 * frustum. Same (count, seed) always gives the same scene.
 */
std::vector<CPUSphere> generateRandomSphereSystem(uint32_t count, uint32_t seed);
