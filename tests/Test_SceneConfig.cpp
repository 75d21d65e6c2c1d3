#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "SceneConfig.hpp"

using json = nlohmann::json;

namespace
{
    std::string WriteTempFile(const std::string& name, const std::string& contents)
    {
        auto path = std::filesystem::temp_directory_path() / name;
        std::ofstream out(path);
        out << contents;
        return path.string();
    }
}

TEST(SceneConfig, EmptyObjectKeepsDefaults)
{
    SceneConfig c = parseSceneConfig(json::object());
    EXPECT_EQ(c.maxLeafSize, 6);
    EXPECT_EQ(c.maxDepth, 20);
    EXPECT_FLOAT_EQ(c.cameraPosition.y, 20.0f);
    EXPECT_FLOAT_EQ(c.cameraPosition.z, 50.0f);
    EXPECT_FLOAT_EQ(c.cameraTarget.y, 10.0f);
    EXPECT_FLOAT_EQ(c.cameraFov, 45.0f);
    EXPECT_EQ(c.previewWidth, 320u);
    EXPECT_EQ(c.previewHeight, 240u);
    EXPECT_TRUE(c.spheres.empty());
    EXPECT_EQ(c.randomCount, 0u);
    EXPECT_TRUE(c.collectSpheres().empty());
}

TEST(SceneConfig, ParsesEverySection)
{
    json j = json::parse(R"({
        "bvh":     { "maxLeafSize": 4, "maxDepth": 12 },
        "camera":  { "position": [1, 2, 3], "target": [0, 0, -1], "fov": 60 },
        "preview": { "width": 64, "height": 32 },
        "random":  { "count": 5, "seed": 77 },
        "spheres": [
            { "center": [0, 1, 0], "radius": 0.5, "color": [1, 0, 0], "metallic": 0.9 },
            { "center": [2, 0, 0], "radius": 1 }
        ]
    })");

    SceneConfig c = parseSceneConfig(j);
    EXPECT_EQ(c.maxLeafSize, 4);
    EXPECT_EQ(c.maxDepth, 12);
    EXPECT_FLOAT_EQ(c.cameraPosition.x, 1.0f);
    EXPECT_FLOAT_EQ(c.cameraTarget.z, -1.0f);
    EXPECT_FLOAT_EQ(c.cameraFov, 60.0f);
    EXPECT_EQ(c.previewWidth, 64u);
    EXPECT_EQ(c.previewHeight, 32u);
    EXPECT_EQ(c.randomCount, 5u);
    EXPECT_EQ(c.randomSeed, 77u);

    ASSERT_EQ(c.spheres.size(), 2u);
    EXPECT_FLOAT_EQ(c.spheres[0].centerY, 1.0f);
    EXPECT_FLOAT_EQ(c.spheres[0].colorR, 1.0f);
    EXPECT_FLOAT_EQ(c.spheres[0].metallic, 0.9f);
    EXPECT_FLOAT_EQ(c.spheres[1].radius, 1.0f);
    EXPECT_FLOAT_EQ(c.spheres[1].metallic, 0.3f);   // default

    auto all = c.collectSpheres();
    ASSERT_EQ(all.size(), 7u);
    EXPECT_FLOAT_EQ(all[0].centerY, 1.0f);
    EXPECT_FLOAT_EQ(all[1].centerX, 2.0f);
    auto gen = generateRandomSphereSystem(5, 77);
    EXPECT_FLOAT_EQ(all[2].centerX, gen[0].centerX);
    EXPECT_FLOAT_EQ(all[6].radius, gen[4].radius);
}

TEST(SceneConfig, OutOfRangeBuildLimitsAreKeptForClamping)
{
    SceneConfig c = parseSceneConfig(json::parse(R"({ "bvh": { "maxLeafSize": 99, "maxDepth": 0 } })"));
    EXPECT_EQ(c.maxLeafSize, 99);
    EXPECT_EQ(c.maxDepth, 0);

    BVHBuilder b;
    b.setConfiguration(c.maxLeafSize, c.maxDepth);
    EXPECT_EQ(b.maxLeafSize(), 16u);
    EXPECT_EQ(b.maxDepth(), 1u);
}

TEST(SceneConfig, HugeBuildLimitsSaturateInsteadOfWrapping)
{
    // 4294967302 == 2^32 + 6 would truncate to 6 through a 32-bit cast
    SceneConfig c = parseSceneConfig(json::parse(
        R"({ "bvh": { "maxLeafSize": 4294967302, "maxDepth": -4294967295 } })"));
    EXPECT_EQ(c.maxLeafSize, std::numeric_limits<int>::max());
    EXPECT_EQ(c.maxDepth, std::numeric_limits<int>::min());

    BVHBuilder b;
    b.setConfiguration(c.maxLeafSize, c.maxDepth);
    EXPECT_EQ(b.maxLeafSize(), 16u);
    EXPECT_EQ(b.maxDepth(), 1u);

    c = parseSceneConfig(json::parse(R"({ "bvh": { "maxLeafSize": 18446744073709551615 } })"));
    EXPECT_EQ(c.maxLeafSize, std::numeric_limits<int>::max());
}

TEST(SceneConfig, UnsignedFieldsRejectOutOfRangeValues)
{
    EXPECT_THROW(parseSceneConfig(json::parse(R"({ "random": { "count": -1 } })")),
        std::runtime_error);
    EXPECT_THROW(parseSceneConfig(json::parse(R"({ "random": { "count": 4294967296 } })")),
        std::runtime_error);
    EXPECT_THROW(parseSceneConfig(json::parse(R"({ "random": { "count": 1, "seed": -3 } })")),
        std::runtime_error);
    EXPECT_THROW(parseSceneConfig(json::parse(R"({ "random": { "count": 2.5 } })")),
        std::runtime_error);
    EXPECT_THROW(parseSceneConfig(json::parse(R"({ "preview": { "width": 4294967297 } })")),
        std::runtime_error);
    EXPECT_THROW(parseSceneConfig(json::parse(R"({ "preview": { "height": -240 } })")),
        std::runtime_error);

    SceneConfig c = parseSceneConfig(json::parse(
        R"({ "random": { "count": 0, "seed": 4294967295 }, "preview": { "width": 1 } })"));
    EXPECT_EQ(c.randomCount, 0u);
    EXPECT_EQ(c.randomSeed, 4294967295u);
    EXPECT_EQ(c.previewWidth, 1u);
}

TEST(SceneConfig, MalformedFieldsThrow)
{
    EXPECT_THROW(parseSceneConfig(json::array()), std::runtime_error);
    EXPECT_THROW(parseSceneConfig(json::parse(R"({ "spheres": [ { "center": [0, 1], "radius": 1 } ] })")),
        std::runtime_error);
    EXPECT_THROW(parseSceneConfig(json::parse(R"({ "spheres": [ { "center": [0, 1, 2], "radius": -1 } ] })")),
        std::runtime_error);
    EXPECT_THROW(parseSceneConfig(json::parse(R"({ "spheres": [ { "center": [0, 1, 2] } ] })")),
        std::runtime_error);
    EXPECT_THROW(parseSceneConfig(json::parse(R"({ "bvh": { "maxLeafSize": "six" } })")),
        std::runtime_error);
    EXPECT_THROW(parseSceneConfig(json::parse(R"({ "preview": { "width": 0 } })")),
        std::runtime_error);
    EXPECT_THROW(parseSceneConfig(json::parse(R"({ "random": { "seed": 3 } })")),
        std::runtime_error);
}

TEST(SceneConfig, LoadFromFile)
{
    std::string path = WriteTempFile("spherebvh_scene_test.json",
        R"({ "bvh": { "maxLeafSize": 2 }, "random": { "count": 10 } })");

    SceneConfig c = loadSceneConfig(path);
    EXPECT_EQ(c.maxLeafSize, 2);
    EXPECT_EQ(c.collectSpheres().size(), 10u);
    std::filesystem::remove(path);
}

TEST(SceneConfig, LoadFailuresThrowRuntimeError)
{
    EXPECT_THROW(loadSceneConfig("/nonexistent/dir/scene.json"), std::runtime_error);

    std::string path = WriteTempFile("spherebvh_bad_scene.json", "{ \"bvh\": ");
    EXPECT_THROW(loadSceneConfig(path), std::runtime_error);
    std::filesystem::remove(path);
}
