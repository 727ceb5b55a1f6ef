#include "math.hpp"

namespace {
    const float RAD_TO_TURNS = 1.0f / (2.0f * glm::pi<float>());
    const glm::vec3 WORLD_UP = glm::vec3(0.0f, 1.0f, 0.0f);
    const glm::vec3 WORLD_RIGHT = glm::vec3(1.0f, 0.0f, 0.0f);
    const glm::vec3 WORLD_FORWARD = glm::vec3(0.0f, 0.0f, 1.0f);
}

bool Math::isBetween(float x, float min, float max) {
    return min <= x && x <= max;
}

bool Math::closeEqual(float a, float b, float tolerance) {
    if (a == b) return true;
    float diff = std::fabs(a - b);
    float larger = std::max(std::fabs(a), std::fabs(b));
    return diff <= tolerance * larger;
}

bool Math::closeEqual(const glm::vec3 &a, const glm::vec3 &b, float tolerance) {
    return closeEqual(a.x, b.x, tolerance) &&
           closeEqual(a.y, b.y, tolerance) &&
           closeEqual(a.z, b.z, tolerance);
}

int Math::circularIndex(int a, int size) {
    if (size <= 0) {
        throw std::invalid_argument("circularIndex: size must be positive, got " + std::to_string(size));
    }
    int b = a % size;
    if (b < 0) b += size;
    return b;
}

glm::vec3 Math::averagePosition(const std::vector<glm::vec3> &points) {
    if (points.empty()) {
        throw std::invalid_argument("averagePosition: point list is empty");
    }
    glm::vec3 sum = glm::vec3(0.0f);
    for (const glm::vec3 &p : points) {
        sum += p;
    }
    return sum / static_cast<float>(points.size());
}

glm::vec3 Math::normalizeOr(const glm::vec3 &v, const glm::vec3 &fallback) {
    float len = glm::length(v);
    if (len > NORMALIZE_EPSILON) {
        return v / len;
    }
    return fallback;
}

glm::vec2 Math::cylindricalUV(glm::vec3 vertex) {
    vertex = normalizeOr(vertex, glm::vec3(0.0f));

    // rotation about the Y axis, -0.5..0.5 turns remapped to 0..1
    float longitude = std::atan2(vertex.z, vertex.x) * RAD_TO_TURNS + 0.5f;

    // asin keeps latitude steps equal-angle instead of equal-height
    float latitude = std::asin(vertex.y) * RAD_TO_TURNS * 2.0f + 0.5f;

    return glm::vec2(longitude, latitude);
}

glm::vec2 Math::projectPointOntoPlane(const glm::vec3 &point, const glm::vec3 &planeNormal, const glm::vec3 &planeOrigin) {
    if (planeNormal == glm::vec3(0.0f)) {
        throw std::invalid_argument("projectPointOntoPlane: plane normal cannot be zero");
    }

    glm::vec3 planeXAxis;
    glm::vec3 planeYAxis;

    if (closeEqual(planeNormal, WORLD_UP)) {
        // up x normal would be degenerate
        planeXAxis = WORLD_RIGHT;
        planeYAxis = WORLD_FORWARD;
    } else {
        // a normal along -Y or scaled +Y has no in-plane axis, project to (0, 0)
        planeXAxis = normalizeOr(glm::cross(WORLD_UP, planeNormal), glm::vec3(0.0f));
        planeYAxis = glm::cross(planeNormal, planeXAxis);
    }

    glm::vec3 offset = point - planeOrigin;
    return glm::vec2(glm::dot(offset, planeXAxis), glm::dot(offset, planeYAxis));
}
