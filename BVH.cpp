/* --------------------------------------------------------------------------
   BVH.cpp  –  balanced binary BVH for spheres

   • Recursively splits the longest axis at the object median
   • Stops when leaf size <= maxLeafSize or depth >= maxDepth
   • Nodes are appended pre-order; internal nodes are patched with their
     child indices once both subtrees are built
   --------------------------------------------------------------------------*/
#include "BVH.hpp"
#include <algorithm>
#include <cassert>
#include <chrono>
#include <limits>
#include <stdexcept>
#include <string>

/* ---------- extraction ------------------------------------------------- */
std::vector<SpherePrimitive> extractSpheres(const float* data, uint32_t count)
{
    std::vector<SpherePrimitive> prims;
    prims.reserve(count);

    for (uint32_t i = 0; i < count; ++i) {
        const float* s = data + size_t(i) * FLOATS_PER_SPHERE;

        SpherePrimitive p;
        p.index = i;
        p.center = glm::vec3(s[0], s[1], s[2]);
        p.radius = s[3];
        p.mn = p.center - p.radius;
        p.mx = p.center + p.radius;
        prims.push_back(p);
    }
    return prims;
}

/* ---------- bounds ----------------------------------------------------- */
void computeBounds(const std::vector<SpherePrimitive>& prims,
    const std::vector<uint32_t>& indices,
    uint32_t first, uint32_t count,
    glm::vec3& mn, glm::vec3& mx)
{
    assert(count > 0 && "computeBounds on an empty range");

    mn = glm::vec3(std::numeric_limits<float>::infinity());
    mx = glm::vec3(-std::numeric_limits<float>::infinity());
    for (uint32_t i = first; i < first + count; ++i) {
        const SpherePrimitive& p = prims[indices[i]];
        mn = glm::min(mn, p.mn);
        mx = glm::max(mx, p.mx);
    }
}

/* ---------- split axis ------------------------------------------------- */
int chooseSplitAxis(const glm::vec3& mn, const glm::vec3& mx)
{
    glm::vec3 size = mx - mn;
    int axis = 0;
    if (size.y > size[axis]) axis = 1;
    if (size.z > size[axis]) axis = 2;
    return axis;
}

/* ---------- builder ---------------------------------------------------- */
void BVHBuilder::setConfiguration(int maxLeafSize, int maxDepth)
{
    m_maxLeafSize = (uint32_t)std::clamp(maxLeafSize, (int)MIN_LEAF_SIZE, (int)MAX_LEAF_SIZE);
    m_maxDepth = (uint32_t)std::clamp(maxDepth, (int)MIN_DEPTH, (int)MAX_DEPTH);
}

uint32_t BVHBuilder::emitLeaf(std::vector<BvhNode>& nodes,
    const glm::vec3& mn, const glm::vec3& mx,
    uint32_t first, uint32_t count)
{
    uint32_t myIndex = (uint32_t)nodes.size();

    BvhNode n;
    n.mn = mn;  n.mx = mx;
    n.leftChild = -1;
    n.rightChild = -1;
    n.firstSphere = (int32_t)first;
    n.sphereCount = count;
    nodes.push_back(n);

    ++m_stats.nodeCount;
    ++m_stats.leafCount;
    return myIndex;
}

uint32_t BVHBuilder::buildNode(const std::vector<SpherePrimitive>& prims,
    std::vector<uint32_t>& indices,
    std::vector<BvhNode>& nodes,
    uint32_t first, uint32_t count, uint32_t depth)
{
    m_stats.maxDepth = std::max(m_stats.maxDepth, depth);

    /* compute bounds of this set */
    glm::vec3 mn, mx;
    computeBounds(prims, indices, first, count, mn, mx);

    /* leaf? ------------------------------------------------------------- */
    if (count <= m_maxLeafSize || depth >= m_maxDepth)
        return emitLeaf(nodes, mn, mx, first, count);

    /* sort the range by center along the longest axis ------------------ */
    int axis = chooseSplitAxis(mn, mx);
    std::stable_sort(indices.begin() + first,
        indices.begin() + first + count,
        [&](uint32_t a, uint32_t b) {
            return prims[a].center[axis] < prims[b].center[axis];
        });

    uint32_t leftCount = count / 2;
    uint32_t rightCount = count - leftCount;
    if (leftCount == 0 || rightCount == 0)
        return emitLeaf(nodes, mn, mx, first, count);

    /* placeholder, children patched below ----------------------------- */
    uint32_t myIndex = (uint32_t)nodes.size();
    BvhNode n;
    n.mn = mn;  n.mx = mx;
    n.firstSphere = -1;
    n.sphereCount = 0;
    nodes.push_back(n);
    ++m_stats.nodeCount;

    uint32_t left = buildNode(prims, indices, nodes, first, leftCount, depth + 1);
    uint32_t right = buildNode(prims, indices, nodes, first + leftCount, rightCount, depth + 1);

    nodes[myIndex].leftChild = (int32_t)left;
    nodes[myIndex].rightChild = (int32_t)right;
    return myIndex;
}

/* ---------- public entry ----------------------------------------------- */
BvhBuildResult BVHBuilder::build(const float* spheresData, uint32_t sphereCount)
{
    auto t0 = std::chrono::steady_clock::now();
    m_stats = BvhBuildStats{};

    if (sphereCount == 0)
        return BvhBuildResult{};
    assert(spheresData != nullptr);

    std::vector<SpherePrimitive> prims = extractSpheres(spheresData, sphereCount);

    /* index array for partitioning */
    std::vector<uint32_t> idx(sphereCount);
    for (uint32_t i = 0; i < sphereCount; ++i) idx[i] = i;

    /* worst case for a binary tree over N leaves */
    std::vector<BvhNode> nodes;
    nodes.reserve(size_t(2) * sphereCount);

    /* build recursively – root at index 0 */
    buildNode(prims, idx, nodes, 0, sphereCount, 0);

    BvhBuildResult out = encodeForGPU(nodes, idx, m_stats.maxDepth);

    m_stats.buildTimeMs = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - t0).count();
    return out;
}

BvhBuildResult BVHBuilder::build(const std::vector<float>& spheresData, uint32_t sphereCount)
{
    if (uint64_t(sphereCount) * FLOATS_PER_SPHERE > spheresData.size())
        throw std::out_of_range("sphere buffer holds " + std::to_string(spheresData.size())
            + " floats, " + std::to_string(sphereCount) + " spheres requested");
    return build(spheresData.data(), sphereCount);
}

/* ---------- GPU encoding ----------------------------------------------- */
std::vector<float> encodeNodes(const std::vector<BvhNode>& nodes)
{
    std::vector<float> out(nodes.size() * FLOATS_PER_NODE);

    for (size_t i = 0; i < nodes.size(); ++i) {
        const BvhNode& n = nodes[i];
        float* f = out.data() + i * FLOATS_PER_NODE;

        f[NODE_MIN_X] = n.mn.x;  f[NODE_MIN_Y] = n.mn.y;  f[NODE_MIN_Z] = n.mn.z;
        f[NODE_MAX_X] = n.mx.x;  f[NODE_MAX_Y] = n.mx.y;  f[NODE_MAX_Z] = n.mx.z;

        if (n.isLeaf()) {
            f[NODE_LEFT_CHILD] = -1.f;   /* the shader's only leaf test */
            f[NODE_RIGHT_CHILD] = -1.f;
            f[NODE_FIRST_SPHERE] = (float)n.firstSphere;
            f[NODE_SPHERE_COUNT] = (float)n.sphereCount;
        }
        else {
            f[NODE_LEFT_CHILD] = (float)n.leftChild;
            f[NODE_RIGHT_CHILD] = (float)n.rightChild;
            f[NODE_FIRST_SPHERE] = -1.f;
            f[NODE_SPHERE_COUNT] = 0.f;
        }
    }
    return out;
}

BvhBuildResult encodeForGPU(const std::vector<BvhNode>& nodes,
    const std::vector<uint32_t>& indices,
    uint32_t maxDepth)
{
    BvhBuildResult out;
    out.nodes = encodeNodes(nodes);
    out.sphereIndices = indices;
    out.nodeCount = (uint32_t)nodes.size();
    out.maxDepth = maxDepth;
    out.leafCount = (uint32_t)std::count_if(nodes.begin(), nodes.end(),
        [](const BvhNode& n) { return n.isLeaf(); });
    return out;
}

/* ---------- sizing helpers --------------------------------------------- */
uint64_t estimateNodeBufferSize(uint32_t sphereCount)
{
    uint64_t estimatedNodes = std::max<uint64_t>(100, uint64_t(sphereCount) * 2);
    return estimatedNodes * BYTES_PER_NODE;
}

uint64_t estimateIndexBufferSize(uint32_t sphereCount)
{
    return uint64_t(sphereCount) * BYTES_PER_INDEX;
}

BvhMemoryUsage bvhMemoryUsage(uint32_t nodeCount, uint32_t sphereCount)
{
    BvhMemoryUsage u;
    u.nodesBytes = uint64_t(nodeCount) * BYTES_PER_NODE;
    u.indicesBytes = estimateIndexBufferSize(sphereCount);
    u.totalBytes = u.nodesBytes + u.indicesBytes;
    u.totalKB = double(u.totalBytes) / 1024.0;
    return u;
}

double estimatedSpeedup(uint32_t sphereCount)
{
    if (sphereCount <= 2) return 1.0;
    double avgTests = std::log2(double(sphereCount)) * 1.5;
    return double(sphereCount) / avgTests;
}
