#include "SphereSystem.hpp"
#include "CommonHeader.hpp"
#include <random>
#include <cmath>
#include <stdexcept>

/* ---------- HSL -> RGB (hue wraps, s/l in [0,1]) ---------------------- */
static float hueToRgb(float p, float q, float t)
{
    if (t < 0.f) t += 1.f;
    if (t > 1.f) t -= 1.f;
    if (t < 1.f / 6.f) return p + (q - p) * 6.f * t;
    if (t < 1.f / 2.f) return q;
    if (t < 2.f / 3.f) return p + (q - p) * (2.f / 3.f - t) * 6.f;
    return p;
}

static void hslToRgb(float h, float s, float l, float& r, float& g, float& b)
{
    h = h - std::floor(h);
    if (s == 0.f) { r = g = b = l; return; }
    float q = (l < 0.5f) ? l * (1.f + s) : l + s - l * s;
    float p = 2.f * l - q;
    r = hueToRgb(p, q, h + 1.f / 3.f);
    g = hueToRgb(p, q, h);
    b = hueToRgb(p, q, h - 1.f / 3.f);
}

std::vector<float> packSphereBuffer(const std::vector<CPUSphere>& spheres)
{
    std::vector<float> data;
    data.reserve(spheres.size() * FLOATS_PER_SPHERE);
    for (const CPUSphere& s : spheres) {
        data.push_back(s.centerX);
        data.push_back(s.centerY);
        data.push_back(s.centerZ);
        data.push_back(s.radius);
        data.push_back(s.colorR);
        data.push_back(s.colorG);
        data.push_back(s.colorB);
        data.push_back(s.metallic);
    }
    return data;
}

std::vector<CPUSphere> unpackSphereBuffer(const std::vector<float>& data, uint32_t count)
{
    if (size_t(count) * FLOATS_PER_SPHERE > data.size())
        throw std::out_of_range("unpackSphereBuffer: buffer too short");

    std::vector<CPUSphere> spheres(count);
    for (uint32_t i = 0; i < count; ++i) {
        const float* f = data.data() + size_t(i) * FLOATS_PER_SPHERE;
        spheres[i] = CPUSphere{ f[0], f[1], f[2], f[3], f[4], f[5], f[6], f[7] };
    }
    return spheres;
}

/**
 * generateRandomSphereSystem:
 *  x in +-15, y in [2,18], z in [-15,15], radius in [0.3,0.8].
 *  Colors walk an HSL hue ramp so neighbouring indices differ.
 */
std::vector<CPUSphere> generateRandomSphereSystem(uint32_t count, uint32_t seed)
{
    std::vector<CPUSphere> results;
    results.reserve(count);

    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> unit(0.f, 1.f);

    const float worldSize = 30.f;
    const float minY = 2.f, maxY = 18.f;
    const float minZ = -15.f, maxZ = 15.f;

    for (uint32_t i = 0; i < count; i++)
    {
        CPUSphere s{};
        s.centerX = (unit(rng) - 0.5f) * worldSize;
        s.centerY = minY + unit(rng) * (maxY - minY);
        s.centerZ = minZ + unit(rng) * (maxZ - minZ);
        s.radius = 0.3f + unit(rng) * 0.5f;

        hslToRgb(float(i) / 10.f, 0.7f, 0.6f, s.colorR, s.colorG, s.colorB);
        s.metallic = 0.3f;

        results.push_back(s);
    }

    return results;
}
