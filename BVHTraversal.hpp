#pragma once
#include "CommonHeader.hpp"
#include <vector>
#include <cstdint>

/* --------------------------------------------------------------------------
   CPU mirror of the compute-shader traversal.

   Reads exactly the buffers the shader binds: encoded nodes, the index
   permutation and the raw sphere buffer. Used to check an encoded BVH
   against a brute-force scan and to render previews.
   --------------------------------------------------------------------------*/

struct Ray {
    glm::vec3 origin;
    glm::vec3 dir;             /* need not be normalized */
};

struct SphereHit {
    int32_t sphereIndex = -1;  /* original input index, -1 = miss */
    float   t = 0.f;
};

struct TraversalStats {
    uint64_t nodesVisited = 0;
    uint64_t sphereTests = 0;
};

/* nearest positive root of |o + t d - c|^2 = r^2, or false */
bool intersectSphere(const Ray& ray, const float* sphere, float& t);

/* slab test, true if the box is hit before tMax */
bool intersectAABB(const Ray& ray, const glm::vec3& invDir,
    const float* node, float tMax);

SphereHit traceBVH(const std::vector<float>& nodeBuffer,
    const std::vector<uint32_t>& indexBuffer,
    const std::vector<float>& sphereBuffer,
    const Ray& ray,
    TraversalStats* stats = nullptr);

SphereHit traceLinear(const std::vector<float>& sphereBuffer,
    uint32_t sphereCount,
    const Ray& ray,
    TraversalStats* stats = nullptr);
