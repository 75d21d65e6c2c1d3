/*  SceneConfig.cpp  – JSON scene / build configuration loader            */
#include "SceneConfig.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

/*=========================================================================*/
/*  field helpers                                                          */
/*=========================================================================*/
static glm::vec3 readVec3(const json& j, const char* field)
{
    if (!j.is_array() || j.size() != 3)
        throw std::runtime_error(std::string("scene: '") + field + "' must be an array of 3 numbers");
    return glm::vec3(j[0].get<float>(), j[1].get<float>(), j[2].get<float>());
}

/* range-check on the stored 64-bit value; get<uint32_t>() would truncate */
static bool readInt64(const json& j, long long& v)
{
    if (j.is_number_unsigned()) {
        unsigned long long u = j.get<unsigned long long>();
        v = u > (unsigned long long)std::numeric_limits<long long>::max()
            ? std::numeric_limits<long long>::max() : (long long)u;
        return true;
    }
    if (!j.is_number_integer()) return false;
    v = j.get<long long>();
    return true;
}

static uint32_t readUint32(const json& j, const char* field, long long minValue)
{
    long long v = 0;
    if (!readInt64(j, v) || v < minValue || v > (long long)std::numeric_limits<uint32_t>::max())
        throw std::runtime_error(std::string("scene: '") + field + "' must be an integer in ["
            + std::to_string(minValue) + ", 4294967295]");
    return uint32_t(v);
}

static uint32_t readPositive(const json& j, const char* field)
{
    return readUint32(j, field, 1);
}

/* bvh limits are clamped later by the builder, so saturate to int */
static int readClampedInt(const json& j, const char* field)
{
    long long v = 0;
    if (!readInt64(j, v))
        throw std::runtime_error(std::string("scene: '") + field + "' must be an integer");
    v = std::min<long long>(std::max<long long>(v, std::numeric_limits<int>::min()),
        std::numeric_limits<int>::max());
    return int(v);
}

static CPUSphere readSphere(const json& S)
{
    CPUSphere s{};
    glm::vec3 c = readVec3(S.at("center"), "center");
    s.centerX = c.x; s.centerY = c.y; s.centerZ = c.z;

    s.radius = S.at("radius").get<float>();
    if (!(s.radius >= 0.f))
        throw std::runtime_error("scene: sphere 'radius' must be >= 0");

    glm::vec3 col(0.8f);
    if (S.contains("color")) col = readVec3(S["color"], "color");
    s.colorR = col.x; s.colorG = col.y; s.colorB = col.z;
    s.metallic = S.contains("metallic") ? S["metallic"].get<float>() : 0.3f;
    return s;
}

/*=========================================================================*/
/*  parse                                                                  */
/*=========================================================================*/
SceneConfig parseSceneConfig(const json& root)
{
    if (!root.is_object())
        throw std::runtime_error("scene: top level must be an object");

    SceneConfig C;
    try {
        if (root.contains("bvh")) {
            const json& B = root["bvh"];
            if (B.contains("maxLeafSize")) C.maxLeafSize = readClampedInt(B["maxLeafSize"], "maxLeafSize");
            if (B.contains("maxDepth"))    C.maxDepth = readClampedInt(B["maxDepth"], "maxDepth");
        }

        if (root.contains("camera")) {
            const json& K = root["camera"];
            if (K.contains("position")) C.cameraPosition = readVec3(K["position"], "position");
            if (K.contains("target"))   C.cameraTarget = readVec3(K["target"], "target");
            if (K.contains("fov"))      C.cameraFov = K["fov"].get<float>();
        }

        if (root.contains("preview")) {
            const json& P = root["preview"];
            if (P.contains("width"))  C.previewWidth = readPositive(P["width"], "width");
            if (P.contains("height")) C.previewHeight = readPositive(P["height"], "height");
        }

        if (root.contains("random")) {
            const json& R = root["random"];
            C.randomCount = readUint32(R.at("count"), "count", 0);
            if (R.contains("seed")) C.randomSeed = readUint32(R["seed"], "seed", 0);
        }

        if (root.contains("spheres")) {
            for (const json& S : root.at("spheres"))
                C.spheres.push_back(readSphere(S));
        }
    }
    catch (const json::exception& e) {
        /* type errors / missing keys from nlohmann */
        throw std::runtime_error(std::string("scene: ") + e.what());
    }
    return C;
}

SceneConfig loadSceneConfig(const std::string& path)
{
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Cannot open " + path);

    json root;
    try {
        in >> root;
    }
    catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }
    return parseSceneConfig(root);
}

std::vector<CPUSphere> SceneConfig::collectSpheres() const
{
    std::vector<CPUSphere> all = spheres;
    if (randomCount > 0) {
        std::vector<CPUSphere> gen = generateRandomSphereSystem(randomCount, randomSeed);
        all.insert(all.end(), gen.begin(), gen.end());
    }
    return all;
}
