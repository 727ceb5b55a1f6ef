#pragma once

#include "Math.hpp"
#include <glm/glm.hpp>
#include <tsl/robin_map.h>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>

// Bucket width used when no tolerance is given.
constexpr float DEFAULT_HASH_TOLERANCE = 0.0001f;

// Index of the tolerance-wide cell holding value. Rounds half to even.
inline int64_t toleranceBucket(float value, float tolerance) {
    return static_cast<int64_t>(std::llrint(value / tolerance));
}

inline float checkedTolerance(float tolerance) {
    if (!(tolerance > 0.0f)) {
        throw std::invalid_argument("tolerance must be positive");
    }
    return tolerance;
}

/**
 * Hash consistent with Math::closeEqual at the same tolerance: each axis is
 * quantized to its bucket index and the indices are mixed with 397.
 *
 * closeEqual is not transitive, so the contract only holds inside a bucket.
 * Two close positions straddling a bucket boundary hash differently and a hash
 * container keyed on them keeps both.
 */
struct CloseVec3Hasher {
    float tolerance = DEFAULT_HASH_TOLERANCE;

    CloseVec3Hasher() = default;
    explicit CloseVec3Hasher(float tolerance) : tolerance(checkedTolerance(tolerance)) {}

    size_t operator()(const glm::vec3 &v) const noexcept {
        uint64_t h = static_cast<uint64_t>(toleranceBucket(v.x, tolerance));
        h = (h * 397) ^ static_cast<uint64_t>(toleranceBucket(v.y, tolerance));
        h = (h * 397) ^ static_cast<uint64_t>(toleranceBucket(v.z, tolerance));
        return static_cast<size_t>(h);
    }
};

struct CloseVec3Equal {
    float tolerance = DEFAULT_HASH_TOLERANCE;

    CloseVec3Equal() = default;
    explicit CloseVec3Equal(float tolerance) : tolerance(checkedTolerance(tolerance)) {}

    bool operator()(const glm::vec3 &a, const glm::vec3 &b) const {
        return Math::closeEqual(a, b, tolerance);
    }
};

template <typename V>
using CloseVec3Map = tsl::robin_map<glm::vec3, V, CloseVec3Hasher, CloseVec3Equal>;

template <typename V>
CloseVec3Map<V> makeCloseVec3Map(float tolerance, size_t bucketCount = 0) {
    return CloseVec3Map<V>(bucketCount, CloseVec3Hasher(tolerance), CloseVec3Equal(tolerance));
}
