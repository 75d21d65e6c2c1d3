#include "BVHTraversal.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

/* ---------- primitives ------------------------------------------------- */
bool intersectSphere(const Ray& ray, const float* sphere, float& t)
{
    glm::vec3 c(sphere[0], sphere[1], sphere[2]);
    float r = sphere[3];

    glm::vec3 oc = ray.origin - c;
    float a = glm::dot(ray.dir, ray.dir);
    float halfB = glm::dot(oc, ray.dir);
    float cc = glm::dot(oc, oc) - r * r;
    float disc = halfB * halfB - a * cc;
    if (disc < 0.f) return false;

    float sq = std::sqrt(disc);
    float t0 = (-halfB - sq) / a;
    float t1 = (-halfB + sq) / a;
    if (t0 > 1e-4f) { t = t0; return true; }
    if (t1 > 1e-4f) { t = t1; return true; }   /* origin inside the sphere */
    return false;
}

bool intersectAABB(const Ray& ray, const glm::vec3& invDir,
    const float* node, float tMax)
{
    glm::vec3 mn(node[NODE_MIN_X], node[NODE_MIN_Y], node[NODE_MIN_Z]);
    glm::vec3 mx(node[NODE_MAX_X], node[NODE_MAX_Y], node[NODE_MAX_Z]);

    float tNear = 0.f;
    float tFar = std::numeric_limits<float>::infinity();
    for (int a = 0; a < 3; ++a) {
        float t0 = (mn[a] - ray.origin[a]) * invDir[a];
        float t1 = (mx[a] - ray.origin[a]) * invDir[a];
        /* 0 * inf: origin on a face, ray parallel to it; the closed slab holds the whole ray */
        if (std::isnan(t0) || std::isnan(t1)) continue;
        tNear = std::max(tNear, std::min(t0, t1));
        tFar = std::min(tFar, std::max(t0, t1));
    }

    /* widen slightly so grazing hits on a tight box survive rounding */
    tFar *= 1.0f + 1e-5f;
    return tNear <= tFar && tNear <= tMax;
}

/* ---------- BVH walk (same control flow as the kernel) ------------------ */
SphereHit traceBVH(const std::vector<float>& nodeBuffer,
    const std::vector<uint32_t>& indexBuffer,
    const std::vector<float>& sphereBuffer,
    const Ray& ray,
    TraversalStats* stats)
{
    SphereHit hit;
    if (nodeBuffer.size() < FLOATS_PER_NODE) return hit;

    float best = std::numeric_limits<float>::infinity();
    glm::vec3 invDir = 1.0f / ray.dir;

    int32_t stack[MAX_TRAVERSAL_STACK];
    uint32_t sp = 0;
    stack[sp++] = 0;                               /* root */

    while (sp > 0) {
        int32_t nodeIdx = stack[--sp];
        const float* node = nodeBuffer.data() + size_t(nodeIdx) * FLOATS_PER_NODE;
        if (stats) ++stats->nodesVisited;

        if (!intersectAABB(ray, invDir, node, best)) continue;

        int32_t left = (int32_t)node[NODE_LEFT_CHILD];
        if (left < 0) {
            /* leaf: test its slice of the permutation */
            uint32_t first = (uint32_t)node[NODE_FIRST_SPHERE];
            uint32_t count = (uint32_t)node[NODE_SPHERE_COUNT];
            for (uint32_t i = first; i < first + count; ++i) {
                uint32_t s = indexBuffer[i];
                float t;
                if (stats) ++stats->sphereTests;
                if (intersectSphere(ray, sphereBuffer.data() + size_t(s) * FLOATS_PER_SPHERE, t)
                    && t < best) {
                    best = t;
                    hit.sphereIndex = (int32_t)s;
                    hit.t = t;
                }
            }
            continue;
        }

        /* kernel drops children once the stack is full */
        if (sp + 2 > MAX_TRAVERSAL_STACK) continue;
        stack[sp++] = (int32_t)node[NODE_RIGHT_CHILD];
        stack[sp++] = left;
    }
    return hit;
}

SphereHit traceLinear(const std::vector<float>& sphereBuffer,
    uint32_t sphereCount,
    const Ray& ray,
    TraversalStats* stats)
{
    SphereHit hit;
    float best = std::numeric_limits<float>::infinity();

    for (uint32_t s = 0; s < sphereCount; ++s) {
        float t;
        if (stats) ++stats->sphereTests;
        if (intersectSphere(ray, sphereBuffer.data() + size_t(s) * FLOATS_PER_SPHERE, t)
            && t < best) {
            best = t;
            hit.sphereIndex = (int32_t)s;
            hit.t = t;
        }
    }
    return hit;
}
