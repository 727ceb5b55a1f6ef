#pragma once
#include <glm/glm.hpp>
#include <vector>

class Math {
public:
    static constexpr float DEFAULT_CLOSE_TOLERANCE = 0.001f;
    // Squared lengths at or below this normalize to the caller's fallback.
    static constexpr float NORMALIZE_EPSILON = 1e-5f;

    static bool isBetween(float x, float min, float max);

    /**
     * Scale-invariant comparison: |a - b| <= tolerance * max(|a|, |b|).
     * Two values that should both be zero but carry opposite-sign rounding
     * noise compare unequal, since the reference magnitude collapses with them.
     */
    static bool closeEqual(float a, float b, float tolerance = DEFAULT_CLOSE_TOLERANCE);
    // Per-axis closeEqual; not a euclidean distance test.
    static bool closeEqual(const glm::vec3 &a, const glm::vec3 &b, float tolerance = DEFAULT_CLOSE_TOLERANCE);

    // Floor modulo, always in [0, size). circularIndex(-1, 5) == 4.
    static int circularIndex(int a, int size);

    static glm::vec3 averagePosition(const std::vector<glm::vec3> &points);
    static glm::vec3 normalizeOr(const glm::vec3 &v, const glm::vec3 &fallback);

    /**
     * Maps a direction to cylindrical UVs. x is the longitude around the
     * Y axis remapped to [0, 1), y is the latitude in equal-angle steps from
     * the south pole (0) to the north pole (1).
     */
    static glm::vec2 cylindricalUV(glm::vec3 vertex);

    /**
     * 2D coordinates of point in the plane basis through planeOrigin.
     * A plane facing world up uses +X/+Z as its axes, any other normal uses
     * X = normalize(up x normal) and Y = normal x X. Y is not renormalized, so
     * planeNormal is expected to be unit length. Other normals parallel to Y
     * have no X axis and every point projects to (0, 0).
     * Throws std::invalid_argument for a zero normal.
     */
    static glm::vec2 projectPointOntoPlane(const glm::vec3 &point, const glm::vec3 &planeNormal, const glm::vec3 &planeOrigin);
};
