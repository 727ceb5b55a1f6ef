#pragma once
#include "IndexFormat.hpp"
#include "GeometrySettings.hpp"
#include "../math/BoundingBox.hpp"
#include <glm/glm.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

class HostMeshTracker;

/**
 * Engine-independent mesh data. Owns no host resource, so it can be built,
 * mutated, copied and discarded on any thread. Concurrent mutation of one
 * instance has to be serialized by the caller.
 *
 * Optional channels are either absent or hold exactly vertexCount() entries.
 * bounds is a cached value: it only matches vertices after recalculateBounds().
 */
class GeometryBuffer {
public:
    static constexpr int UV_CHANNELS = 3;

    IndexFormat indexFormat = IndexFormat::UInt16;
    std::vector<glm::vec3> vertices;
    std::vector<uint32_t> triangles;

    std::optional<std::vector<glm::vec3>> normals;
    std::array<std::optional<std::vector<glm::vec2>>, UV_CHANNELS> uvs;
    std::optional<std::vector<glm::vec4>> colors;
    // xyz = tangent, w = handedness
    std::optional<std::vector<glm::vec4>> tangents;

    BoundingBox bounds;
    std::string name;

    // Handed the host mesh after conversion. Not owned.
    HostMeshTracker * tracker = nullptr;

    GeometryBuffer() = default;
    explicit GeometryBuffer(std::string name);

    size_t vertexCount() const;
    size_t triangleCount() const;

    // Index format a conversion will use: UInt32 once the vertex count
    // reaches WIDE_INDEX_VERTEX_THRESHOLD, the stored hint otherwise.
    IndexFormat effectiveIndexFormat() const;

    void recalculateBounds();

    /**
     * Rebuilds normals from triangles. Each face adds its unnormalized cross
     * product to its three vertices, so faces contribute in proportion to their
     * area. Vertices only touched by degenerate faces, or by none, get
     * settings.degenerateNormal. The cutoff applies to the summed, unnormalized
     * cross products (length <= Math::NORMALIZE_EPSILON), so faces with edges
     * below roughly 3e-3 units count as degenerate too; scale tiny meshes up
     * first. No-op without vertices or triangles.
     * Throws GeometryException if a triangle index is out of range.
     */
    void recalculateNormals(const GeometrySettings &settings = GeometrySettings());

    // Throws GeometryException describing the first broken invariant.
    void validate() const;

    /**
     * Merges vertices that are closeEqual at tolerance and share a hash bucket.
     * The first occurrence keeps its attributes and triangles are remapped.
     * bounds is left untouched. Returns the number of vertices removed.
     */
    size_t weldVertices(float tolerance);
    size_t weldVertices(const GeometrySettings &settings = GeometrySettings());

private:
    void validateTriangles() const;
};
