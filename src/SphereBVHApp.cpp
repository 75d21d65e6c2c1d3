/*****************************************************************************************
 * SphereBVHApp.cpp – front‑end logic
 *   • Build mode      (Mode::Build)      one scene file -> GPU buffers + preview PNG
 *   • Benchmark mode  (Mode::Benchmark)  growing random scenes, BVH vs. linear scan
 *****************************************************************************************/
#include "SphereBVHApp.hpp"
#include "FileUtils.hpp"

/* ---------- std / utility ---------- */
#include <iostream>
#include <iomanip>
#include <fstream>
#include <cmath>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <algorithm>

/* ---------- stb_image_write for PNG output ---------- */
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

/* ---------- preview lighting (matches the default scene) ---------- */
static const glm::vec3 kLightPos(10.f, 40.f, 10.f);
static const float     kAmbient = 0.15f;
static const glm::vec3 kSkyTop(0.53f, 0.70f, 0.92f);
static const glm::vec3 kSkyBottom(0.95f, 0.95f, 0.97f);

static glm::vec3 shade(const SphereHit& hit, const Ray& ray, const std::vector<float>& spheres)
{
    if (hit.sphereIndex < 0) {
        float k = 0.5f * (glm::normalize(ray.dir).y + 1.f);
        return kSkyBottom * (1.f - k) + kSkyTop * k;
    }
    const float* s = spheres.data() + size_t(hit.sphereIndex) * FLOATS_PER_SPHERE;
    glm::vec3 c(s[0], s[1], s[2]);
    glm::vec3 albedo(s[4], s[5], s[6]);

    glm::vec3 p = ray.origin + hit.t * ray.dir;
    glm::vec3 n = glm::normalize(p - c);
    float diff = std::max(0.f, glm::dot(n, glm::normalize(kLightPos - p)));
    return albedo * (kAmbient + (1.f - kAmbient) * diff);
}

/*==============================================================*/
/*              C T O R S                                       */
/*==============================================================*/
SphereBVHApp::SphereBVHApp(const std::string& scenePath,
    const std::string& outDir)
    :m_mode(Mode::Build), m_scenePath(scenePath), m_outDir(outDir)
{
    m_config = loadSceneConfig(scenePath);
    m_camera = Camera(m_config.cameraPosition, m_config.cameraTarget, m_config.cameraFov);
    m_builder.setConfiguration(m_config.maxLeafSize, m_config.maxDepth);
    std::cout << "BVH config: max leaf size=" << m_builder.maxLeafSize()
        << ", max depth=" << m_builder.maxDepth() << "\n";
    std::filesystem::create_directories(outDir);
}
SphereBVHApp::SphereBVHApp(const std::string& outDir,
    uint32_t numSamples)
    :m_mode(Mode::Benchmark), m_outDir(outDir), m_numSamples(numSamples)
{
    m_config.previewWidth = 160;
    m_config.previewHeight = 120;
    m_camera = Camera(m_config.cameraPosition, m_config.cameraTarget, m_config.cameraFov);
    std::filesystem::create_directories(outDir);
}
/*==============================================================*/
/*                        P U B L I C                           */
/*==============================================================*/
void SphereBVHApp::run()
{
    if (m_mode == Mode::Build) buildOnce();
    else                       benchmarkLoop();
}
/*==============================================================*/
/*                  B U I L D   M O D E                         */
/*==============================================================*/
void SphereBVHApp::buildOnce()
{
    setScene(m_config.collectSpheres());
    if (m_numSpheres == 0)
        throw std::runtime_error("Scene " + m_scenePath + " contains no spheres");

    rebuildBVH();
    writeBuffers(m_outDir);

    std::vector<uint8_t> rgba;
    RenderTiming t = renderPreview(true, rgba);
    capturePreviewToPNG(m_outDir + "/preview.png", rgba);
    std::cout << "Preview " << m_config.previewWidth << "x" << m_config.previewHeight
        << " rendered in " << std::fixed << std::setprecision(2) << t.ms << "ms ("
        << t.sphereTests << " sphere tests, " << t.nodesVisited << " nodes visited)\n";
}
/*==============================================================*/
/*              B E N C H M A R K   L O O P                     */
/*==============================================================*/
void SphereBVHApp::benchmarkLoop()
{
    json report = json::array();

    for (uint32_t i = 0; i < m_numSamples; ++i)
    {
        /* fresh random scene, 200 more spheres per sample ------------ */
        const uint32_t count = 200u * (i + 1);
        setScene(generateRandomSphereSystem(count, 1234u + i));
        rebuildBVH();

        std::vector<uint8_t> bvhImg, linImg;
        RenderTiming tb = renderPreview(true, bvhImg);
        RenderTiming tl = renderPreview(false, linImg);

        size_t mismatched = 0;
        for (size_t p = 0; p < bvhImg.size(); p += 4)
            if (!std::equal(bvhImg.begin() + p, bvhImg.begin() + p + 4, linImg.begin() + p))
                ++mismatched;

        makeSampleDir(i);
        capturePreviewToPNG(sampleDir(i) + "/preview.png", bvhImg);

        const BvhBuildStats st = m_builder.getLastBuildStats();
        const double speedup = tb.ms > 0.0 ? tl.ms / tb.ms : 0.0;
        report.push_back({
            { "spheres", count },
            { "nodes", st.nodeCount },
            { "leaves", st.leafCount },
            { "maxDepth", st.maxDepth },
            { "buildMs", st.buildTimeMs },
            { "bvhMs", tb.ms },
            { "linearMs", tl.ms },
            { "bvhSphereTests", tb.sphereTests },
            { "linearSphereTests", tl.sphereTests },
            { "bvhNodesVisited", tb.nodesVisited },
            { "measuredSpeedup", speedup },
            { "estimatedSpeedup", estimatedSpeedup(count) },
            { "mismatchedPixels", mismatched }
            });

        /* progress */
        std::cout << "[" << i + 1 << "/" << m_numSamples << "] " << count << " spheres: BVH "
            << std::fixed << std::setprecision(1) << tb.ms << "ms, linear " << tl.ms
            << "ms, speedup " << speedup << "x";
        if (mismatched) std::cout << "  (" << mismatched << " pixels differ!)";
        std::cout << "\n";
    }

    std::ofstream jf(m_outDir + "/benchmark.json");
    if (!jf) throw std::runtime_error("Cannot write " + m_outDir + "/benchmark.json");
    jf << report.dump(2) << "\n";
}
/*==============================================================*/
/*                S C E N E  /  B V H                           */
/*==============================================================*/
void SphereBVHApp::setScene(const std::vector<CPUSphere>& spheres)
{
    m_cpuSpheres = spheres;
    m_sphereBuffer = packSphereBuffer(m_cpuSpheres);
    m_numSpheres = (uint32_t)m_cpuSpheres.size();
}

void SphereBVHApp::rebuildBVH()
{
    m_cachedBVH = m_builder.build(m_sphereBuffer, m_numSpheres);
    logBuildStats();
}

void SphereBVHApp::logBuildStats() const
{
    const BvhBuildStats st = m_builder.getLastBuildStats();
    const BvhMemoryUsage mem = bvhMemoryUsage(m_cachedBVH.nodeCount, m_numSpheres);

    std::cout << std::fixed << std::setprecision(1)
        << "BVH build done:\n"
        << "  |- Spheres: " << m_numSpheres << "\n"
        << "  |- Nodes: " << st.nodeCount << " (" << st.leafCount << " leaves)\n"
        << "  |- Max depth: " << st.maxDepth << "\n"
        << "  |- GPU memory: " << mem.nodesBytes / 1024.0 << "KB nodes + "
        << mem.indicesBytes / 1024.0 << "KB indices\n"
        << std::setprecision(2)
        << "  `- Build time: " << st.buildTimeMs << "ms\n";

    if (m_numSpheres > 2) {
        const double tests = std::log2(double(m_numSpheres)) * 1.5;
        std::cout << std::setprecision(1) << "Expected speedup: " << estimatedSpeedup(m_numSpheres)
            << "x (" << m_numSpheres << " -> " << tests << " tests/ray)\n";
    }
}

void SphereBVHApp::writeBuffers(const std::string& dir) const
{
    writeBinaryFile(dir + "/nodes.bin", m_cachedBVH.nodes);
    writeBinaryFile(dir + "/indices.bin", m_cachedBVH.sphereIndices);
    writeBinaryFile(dir + "/spheres.bin", m_sphereBuffer);
    std::cout << "Wrote nodes.bin, indices.bin, spheres.bin to " << dir << "\n";
}
/*==============================================================*/
/*                   P R E V I E W                              */
/*==============================================================*/
SphereBVHApp::RenderTiming SphereBVHApp::renderPreview(bool useBVH,
    std::vector<uint8_t>& rgba) const
{
    const uint32_t W = m_config.previewWidth, H = m_config.previewHeight;
    rgba.assign(size_t(W) * H * 4, 255);

    TraversalStats ts;
    auto t0 = std::chrono::steady_clock::now();
    for (uint32_t y = 0; y < H; ++y)
        for (uint32_t x = 0; x < W; ++x) {
            Ray ray;
            m_camera.GenerateRay(x, y, W, H, ray.origin, ray.dir);

            SphereHit hit = useBVH
                ? traceBVH(m_cachedBVH.nodes, m_cachedBVH.sphereIndices, m_sphereBuffer, ray, &ts)
                : traceLinear(m_sphereBuffer, m_numSpheres, ray, &ts);

            glm::vec3 c = glm::clamp(shade(hit, ray, m_sphereBuffer), 0.f, 1.f);
            uint8_t* px = rgba.data() + (size_t(y) * W + x) * 4;
            px[0] = uint8_t(c.r * 255.f + 0.5f);
            px[1] = uint8_t(c.g * 255.f + 0.5f);
            px[2] = uint8_t(c.b * 255.f + 0.5f);
        }

    RenderTiming t;
    t.ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - t0).count();
    t.sphereTests = ts.sphereTests;
    t.nodesVisited = ts.nodesVisited;
    return t;
}
/* ============= helpers for preview output =================== */
std::string SphereBVHApp::sampleDir(uint32_t idx) const
{
    std::ostringstream ss;
    ss << m_outDir << "/sample_" << std::setw(5) << std::setfill('0') << idx;
    return ss.str();
}
void SphereBVHApp::makeSampleDir(uint32_t idx) const
{
    std::filesystem::create_directories(sampleDir(idx));
}
void SphereBVHApp::capturePreviewToPNG(const std::string& fileName,
    const std::vector<uint8_t>& rgba) const
{
    const int W = (int)m_config.previewWidth, H = (int)m_config.previewHeight;
    if (!stbi_write_png(fileName.c_str(), W, H, 4, rgba.data(), W * 4))
        throw std::runtime_error("Failed to write " + fileName);
}
