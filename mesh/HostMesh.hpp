#pragma once
#include "IndexFormat.hpp"
#include "../math/BoundingBox.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * A host engine's native mesh as seen by HostMeshGateway.
 * Implementations wrap a thread-affine engine resource: every call is only
 * legal on the host's designated thread. Channels that were never set read
 * back as std::nullopt.
 */
class HostMesh {
public:
    virtual ~HostMesh() = default;

    virtual void setIndexFormat(IndexFormat format) = 0;
    virtual IndexFormat getIndexFormat() const = 0;

    virtual void setVertices(const std::vector<glm::vec3> &vertices) = 0;
    virtual std::vector<glm::vec3> getVertices() const = 0;

    virtual void setTriangles(const std::vector<uint32_t> &triangles) = 0;
    virtual std::vector<uint32_t> getTriangles() const = 0;

    virtual void setNormals(const std::vector<glm::vec3> &normals) = 0;
    virtual std::optional<std::vector<glm::vec3>> getNormals() const = 0;

    virtual void setUVs(int channel, const std::vector<glm::vec2> &uvs) = 0;
    virtual std::optional<std::vector<glm::vec2>> getUVs(int channel) const = 0;

    virtual void setColors(const std::vector<glm::vec4> &colors) = 0;
    virtual std::optional<std::vector<glm::vec4>> getColors() const = 0;

    virtual void setTangents(const std::vector<glm::vec4> &tangents) = 0;
    virtual std::optional<std::vector<glm::vec4>> getTangents() const = 0;

    virtual void setBounds(const BoundingBox &bounds) = 0;
    virtual BoundingBox getBounds() const = 0;

    virtual void setName(const std::string &name) = 0;
    virtual std::string getName() const = 0;
};

using HostMeshHandle = std::shared_ptr<HostMesh>;

class HostMeshFactory {
public:
    virtual ~HostMeshFactory() = default;
    virtual HostMeshHandle create() = 0;
};

// Host-side object that wants to know which mesh a buffer turned into.
class HostMeshTracker {
public:
    virtual ~HostMeshTracker() = default;
    virtual void setMesh(HostMeshHandle mesh) = 0;
};
