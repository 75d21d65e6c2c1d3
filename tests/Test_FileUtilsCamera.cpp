#include <gtest/gtest.h>

#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <vector>

#include "BVH.hpp"
#include "Camera.hpp"
#include "FileUtils.hpp"
#include "TestSphereBuilders.h"

TEST(FileUtils, DumpedNodeBufferReadsBackByteForByte)
{
    const auto spheres = MakeRandomSphereBuffer(50);
    BVHBuilder builder;
    BvhBuildResult r = builder.build(spheres, 50);

    auto path = (std::filesystem::temp_directory_path() / "spherebvh_nodes_test.bin").string();
    writeBinaryFile(path, r.nodes);

    std::vector<char> bytes = readFile(path);
    ASSERT_EQ(bytes.size(), size_t(r.nodeCount) * BYTES_PER_NODE);
    EXPECT_EQ(std::memcmp(bytes.data(), r.nodes.data(), bytes.size()), 0);
    std::filesystem::remove(path);
}

TEST(FileUtils, MissingFileThrows)
{
    EXPECT_THROW(readFile("/nonexistent/dir/file.bin"), std::runtime_error);
    const float x = 1.0f;
    EXPECT_THROW(writeBinaryFile("/nonexistent/dir/file.bin", &x, sizeof(x)), std::runtime_error);
}

TEST(Camera, CenterRayLooksAtTarget)
{
    Camera cam(glm::vec3(0.0f, 0.0f, 10.0f), glm::vec3(0.0f), 90.0f);
    glm::vec3 o, d;

    // 2x2 image: pixel centers sit symmetrically around the view axis
    cam.GenerateRay(0, 0, 2, 2, o, d);
    EXPECT_FLOAT_EQ(o.z, 10.0f);
    EXPECT_NEAR(glm::length(d), 1.0f, 1e-6f);
    EXPECT_LT(d.x, 0.0f);   // left
    EXPECT_GT(d.y, 0.0f);   // top row points up
    EXPECT_LT(d.z, 0.0f);

    glm::vec3 d2;
    cam.GenerateRay(1, 1, 2, 2, o, d2);
    EXPECT_NEAR(d.x, -d2.x, 1e-6f);
    EXPECT_NEAR(d.y, -d2.y, 1e-6f);
    EXPECT_NEAR(d.z, d2.z, 1e-6f);

    // odd width: middle column has no sideways component
    glm::vec3 mid;
    cam.GenerateRay(1, 1, 3, 3, o, mid);
    EXPECT_NEAR(mid.x, 0.0f, 1e-6f);
    EXPECT_NEAR(mid.y, 0.0f, 1e-6f);
    EXPECT_NEAR(mid.z, -1.0f, 1e-6f);
}

TEST(Camera, LookAtRebuildsBasis)
{
    Camera cam;
    EXPECT_NEAR(glm::dot(cam.Front, cam.Right), 0.0f, 1e-6f);
    EXPECT_NEAR(glm::dot(cam.Front, cam.Up), 0.0f, 1e-6f);

    cam.LookAt(glm::vec3(10.0f, 20.0f, 50.0f));   // straight along +x
    EXPECT_NEAR(cam.Front.x, 1.0f, 1e-6f);
    EXPECT_NEAR(cam.Right.z, 1.0f, 1e-6f);
    EXPECT_NEAR(cam.Up.y, 1.0f, 1e-6f);
}
