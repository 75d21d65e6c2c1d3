#pragma once

#define GLM_FORCE_RADIANS
#include <glm/glm.hpp>

#include <cmath>
#include <cstdint>

/* ---------- shared buffer layout (sphere input / BVH output) ---------- */
constexpr uint32_t FLOATS_PER_SPHERE = 8;   /* cx cy cz r  R G B metallic   */
constexpr uint32_t FLOATS_PER_NODE = 10;    /* mn(3) mx(3) L R first count  */
constexpr uint32_t BYTES_PER_NODE = FLOATS_PER_NODE * sizeof(float);
constexpr uint32_t BYTES_PER_INDEX = sizeof(uint32_t);

/* node field offsets inside one FLOATS_PER_NODE record */
constexpr uint32_t NODE_MIN_X = 0;
constexpr uint32_t NODE_MIN_Y = 1;
constexpr uint32_t NODE_MIN_Z = 2;
constexpr uint32_t NODE_MAX_X = 3;
constexpr uint32_t NODE_MAX_Y = 4;
constexpr uint32_t NODE_MAX_Z = 5;
constexpr uint32_t NODE_LEFT_CHILD = 6;
constexpr uint32_t NODE_RIGHT_CHILD = 7;
constexpr uint32_t NODE_FIRST_SPHERE = 8;
constexpr uint32_t NODE_SPHERE_COUNT = 9;

/* traversal kernels keep a fixed-size stack */
constexpr uint32_t MAX_TRAVERSAL_STACK = 32;
