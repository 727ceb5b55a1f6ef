#include "mesh.hpp"

namespace {

    template <typename T>
    std::vector<T> gather(const std::vector<T> &source, const std::vector<uint32_t> &order) {
        std::vector<T> result;
        result.reserve(order.size());
        for (uint32_t i : order) {
            result.push_back(source[i]);
        }
        return result;
    }

    template <typename T>
    void gatherChannel(std::optional<std::vector<T>> &channel, const std::vector<uint32_t> &order) {
        if (channel) {
            *channel = gather(*channel, order);
        }
    }

    template <typename T>
    void checkChannel(const GeometryBuffer &buffer, const std::optional<std::vector<T>> &channel, const char * channelName) {
        if (channel && channel->size() != buffer.vertexCount()) {
            throw GeometryException("GeometryBuffer '" + buffer.name + "': " + channelName + " has "
                + std::to_string(channel->size()) + " entries, expected " + std::to_string(buffer.vertexCount()));
        }
    }

}

GeometryBuffer::GeometryBuffer(std::string name) : name(std::move(name)) {
}

size_t GeometryBuffer::vertexCount() const {
    return vertices.size();
}

size_t GeometryBuffer::triangleCount() const {
    return triangles.size() / 3;
}

IndexFormat GeometryBuffer::effectiveIndexFormat() const {
    if (vertexCount() >= WIDE_INDEX_VERTEX_THRESHOLD) {
        return IndexFormat::UInt32;
    }
    return indexFormat;
}

void GeometryBuffer::recalculateBounds() {
    if (vertices.empty()) return;

    glm::vec3 min = vertices[0];
    glm::vec3 max = vertices[0];
    for (size_t i = 1; i < vertices.size(); ++i) {
        min = glm::min(min, vertices[i]);
        max = glm::max(max, vertices[i]);
    }
    bounds = BoundingBox(min, max);
}

void GeometryBuffer::recalculateNormals(const GeometrySettings &settings) {
    if (vertices.empty() || triangles.empty()) return;
    validateTriangles();

    if (!normals || normals->size() != vertices.size()) {
        normals.emplace(vertices.size());
    }
    std::vector<glm::vec3> &accum = *normals;
    std::fill(accum.begin(), accum.end(), glm::vec3(0.0f));

    for (size_t i = 0; i + 2 < triangles.size(); i += 3) {
        uint32_t i0 = triangles[i + 0];
        uint32_t i1 = triangles[i + 1];
        uint32_t i2 = triangles[i + 2];

        const glm::vec3 &p0 = vertices[i0];
        const glm::vec3 &p1 = vertices[i1];
        const glm::vec3 &p2 = vertices[i2];

        // length is twice the face area
        glm::vec3 face = glm::cross(p1 - p0, p2 - p0);
        accum[i0] += face;
        accum[i1] += face;
        accum[i2] += face;
    }

    size_t degenerate = 0;
    for (glm::vec3 &n : accum) {
        if (glm::length(n) <= Math::NORMALIZE_EPSILON) {
            ++degenerate;
        }
        n = Math::normalizeOr(n, settings.degenerateNormal);
    }

    if (settings.verbose && degenerate > 0) {
        fprintf(stderr, "[GEOMETRY] '%s': %zu vertices without a usable normal\n", name.c_str(), degenerate);
    }
}

void GeometryBuffer::validateTriangles() const {
    if (triangles.size() % 3 != 0) {
        throw GeometryException("GeometryBuffer '" + name + "': triangle list length "
            + std::to_string(triangles.size()) + " is not a multiple of 3");
    }
    size_t count = vertexCount();
    for (size_t i = 0; i < triangles.size(); ++i) {
        if (triangles[i] >= count) {
            throw GeometryException("GeometryBuffer '" + name + "': index " + std::to_string(triangles[i])
                + " at position " + std::to_string(i) + " is out of range [0, " + std::to_string(count) + ")");
        }
    }
}

void GeometryBuffer::validate() const {
    validateTriangles();
    checkChannel(*this, normals, "normals");
    for (int c = 0; c < UV_CHANNELS; ++c) {
        std::string channelName = "uv" + std::to_string(c);
        checkChannel(*this, uvs[c], channelName.c_str());
    }
    checkChannel(*this, colors, "colors");
    checkChannel(*this, tangents, "tangents");
}

size_t GeometryBuffer::weldVertices(const GeometrySettings &settings) {
    return weldVertices(settings.weldTolerance);
}

size_t GeometryBuffer::weldVertices(float tolerance) {
    CloseVec3Map<uint32_t> compactMap = makeCloseVec3Map<uint32_t>(tolerance, vertices.size());
    if (vertices.empty()) return 0;
    validate();

    std::vector<uint32_t> remap(vertices.size());
    std::vector<uint32_t> kept;
    kept.reserve(vertices.size());

    for (size_t i = 0; i < vertices.size(); ++i) {
        auto [it, inserted] = compactMap.try_emplace(vertices[i], static_cast<uint32_t>(kept.size()));
        if (inserted) {
            kept.push_back(static_cast<uint32_t>(i));
        }
        remap[i] = it->second;
    }

    size_t removed = vertices.size() - kept.size();
    if (removed == 0) return 0;

    vertices = gather(vertices, kept);
    gatherChannel(normals, kept);
    for (auto &uv : uvs) {
        gatherChannel(uv, kept);
    }
    gatherChannel(colors, kept);
    gatherChannel(tangents, kept);

    for (uint32_t &index : triangles) {
        index = remap[index];
    }
    return removed;
}
