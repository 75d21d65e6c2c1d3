#pragma once

#include "SphereSystem.hpp"
#include "BVH.hpp"
#include "BVHTraversal.hpp"
#include "Camera.hpp"
#include "SceneConfig.hpp"

#include <vector>
#include <string>
#include <chrono>

/*------------------------------------------------------------------------------
   SphereBVHApp – front‑end (scene loading, BVH build, buffer dump, benchmark)
------------------------------------------------------------------------------*/
class SphereBVHApp
{
public:
    enum class Mode { Build, Benchmark };

    /* Build constructor – one scene file, buffers written to <outDir> */
    SphereBVHApp(const std::string& scenePath,
        const std::string& outDir);

    /* Benchmark constructor – <numSamples> random scenes of growing size */
    SphereBVHApp(const std::string& outDir,
        uint32_t numSamples);

    void run();                     /* master entry */

private:
    /* ---------- modes ---------- */
    void buildOnce();
    void benchmarkLoop();

    /* ---------- scene / BVH ---------- */
    void setScene(const std::vector<CPUSphere>& spheres);
    void rebuildBVH();
    void logBuildStats() const;
    void writeBuffers(const std::string& dir) const;

    /* ---------- preview ---------- */
    struct RenderTiming {
        double   ms = 0.0;
        uint64_t sphereTests = 0;
        uint64_t nodesVisited = 0;
    };
    RenderTiming renderPreview(bool useBVH, std::vector<uint8_t>& rgba) const;
    void capturePreviewToPNG(const std::string& fileName,
        const std::vector<uint8_t>& rgba) const;
    void makeSampleDir(uint32_t sampleIdx) const;
    std::string sampleDir(uint32_t sampleIdx) const;

    /* ---------- members ---------- */
    Mode         m_mode = Mode::Build;
    std::string  m_scenePath;
    std::string  m_outDir;
    uint32_t     m_numSamples = 0;

    SceneConfig  m_config;
    Camera       m_camera;
    BVHBuilder   m_builder;

    std::vector<CPUSphere> m_cpuSpheres;
    std::vector<float>     m_sphereBuffer;    /* 8 floats per sphere */
    uint32_t               m_numSpheres = 0;
    BvhBuildResult         m_cachedBVH;
};
