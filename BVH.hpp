#pragma once
#include "CommonHeader.hpp"
#include <vector>
#include <cstdint>

/* --------------------------------------------------------------------------
   Binary BVH over spheres, flattened for a compute-shader traversal.

   • Build:  recursive object-median split on the longest axis of bounds.
   • Store:  nodes in pre-order (root = 0), 10 floats per node,
             leftChild == -1 marks a leaf.
   --------------------------------------------------------------------------*/

constexpr uint32_t DEFAULT_MAX_LEAF_SIZE = 6u;
constexpr uint32_t DEFAULT_MAX_DEPTH = 20u;
constexpr uint32_t MIN_LEAF_SIZE = 1u, MAX_LEAF_SIZE = 16u;
constexpr uint32_t MIN_DEPTH = 1u, MAX_DEPTH = 30u;

struct SpherePrimitive {
    uint32_t  index;           /* position in the unordered input */
    glm::vec3 center;
    float     radius;
    glm::vec3 mn, mx;          /* center -/+ radius                */
};

struct BvhNode {
    glm::vec3 mn, mx;
    int32_t   leftChild = -1;  /* -1 for leaves                    */
    int32_t   rightChild = -1;
    int32_t   firstSphere = -1;/* offset into the index permutation */
    uint32_t  sphereCount = 0;

    bool isLeaf() const { return leftChild < 0; }
};

struct BvhBuildResult {
    std::vector<float>    nodes;          /* nodeCount * FLOATS_PER_NODE */
    std::vector<uint32_t> sphereIndices;  /* one per primitive           */
    uint32_t nodeCount = 0;
    uint32_t maxDepth = 0;
    uint32_t leafCount = 0;
};

struct BvhBuildStats {
    uint32_t nodeCount = 0;
    uint32_t leafCount = 0;
    uint32_t maxDepth = 0;
    double   buildTimeMs = 0.0;
};

struct BvhMemoryUsage {
    uint64_t nodesBytes = 0;
    uint64_t indicesBytes = 0;
    uint64_t totalBytes = 0;
    double   totalKB = 0.0;
};

/* ---------- build phases (exposed for tools and tests) ---------------- */

/* data must hold at least count * FLOATS_PER_SPHERE floats */
std::vector<SpherePrimitive> extractSpheres(const float* data, uint32_t count);

/* min/max fold over indices[first .. first+count), count must be > 0 */
void computeBounds(const std::vector<SpherePrimitive>& prims,
    const std::vector<uint32_t>& indices,
    uint32_t first, uint32_t count,
    glm::vec3& mn, glm::vec3& mx);

/* 0/1/2 = x/y/z; equal extents keep the earlier axis */
int chooseSplitAxis(const glm::vec3& mn, const glm::vec3& mx);

std::vector<float> encodeNodes(const std::vector<BvhNode>& nodes);

BvhBuildResult encodeForGPU(const std::vector<BvhNode>& nodes,
    const std::vector<uint32_t>& indices,
    uint32_t maxDepth);

/* ---------- builder ----------------------------------------------------- */
class BVHBuilder
{
public:
    BVHBuilder() = default;

    /* out-of-range values are clamped, never rejected */
    void setConfiguration(int maxLeafSize, int maxDepth);
    uint32_t maxLeafSize() const { return m_maxLeafSize; }
    uint32_t maxDepth() const { return m_maxDepth; }

    BvhBuildResult build(const float* spheresData, uint32_t sphereCount);
    /* throws std::out_of_range if the buffer is shorter than sphereCount records */
    BvhBuildResult build(const std::vector<float>& spheresData, uint32_t sphereCount);

    BvhBuildStats getLastBuildStats() const { return m_stats; }

private:
    uint32_t buildNode(const std::vector<SpherePrimitive>& prims,
        std::vector<uint32_t>& indices,
        std::vector<BvhNode>& nodes,
        uint32_t first, uint32_t count, uint32_t depth);

    uint32_t emitLeaf(std::vector<BvhNode>& nodes,
        const glm::vec3& mn, const glm::vec3& mx,
        uint32_t first, uint32_t count);

    uint32_t      m_maxLeafSize = DEFAULT_MAX_LEAF_SIZE;
    uint32_t      m_maxDepth = DEFAULT_MAX_DEPTH;
    BvhBuildStats m_stats;
};

/* ---------- sizing helpers --------------------------------------------- */

/* pessimistic node-buffer allocation: 2 nodes per sphere, at least 100 */
uint64_t estimateNodeBufferSize(uint32_t sphereCount);
uint64_t estimateIndexBufferSize(uint32_t sphereCount);
BvhMemoryUsage bvhMemoryUsage(uint32_t nodeCount, uint32_t sphereCount);

/* expected ray-sphere tests saved vs. a linear scan */
double estimatedSpeedup(uint32_t sphereCount);
