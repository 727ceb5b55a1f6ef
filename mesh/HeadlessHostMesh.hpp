#pragma once
#include "HostMesh.hpp"
#include <array>

// In-memory HostMesh for tools and tests that run without a render engine.
class HeadlessHostMesh : public HostMesh {
public:
    static constexpr int UV_CHANNELS = 3;

    void setIndexFormat(IndexFormat format) override;
    IndexFormat getIndexFormat() const override;

    void setVertices(const std::vector<glm::vec3> &vertices) override;
    std::vector<glm::vec3> getVertices() const override;

    void setTriangles(const std::vector<uint32_t> &triangles) override;
    std::vector<uint32_t> getTriangles() const override;

    void setNormals(const std::vector<glm::vec3> &normals) override;
    std::optional<std::vector<glm::vec3>> getNormals() const override;

    void setUVs(int channel, const std::vector<glm::vec2> &uvs) override;
    std::optional<std::vector<glm::vec2>> getUVs(int channel) const override;

    void setColors(const std::vector<glm::vec4> &colors) override;
    std::optional<std::vector<glm::vec4>> getColors() const override;

    void setTangents(const std::vector<glm::vec4> &tangents) override;
    std::optional<std::vector<glm::vec4>> getTangents() const override;

    void setBounds(const BoundingBox &bounds) override;
    BoundingBox getBounds() const override;

    void setName(const std::string &name) override;
    std::string getName() const override;

private:
    IndexFormat indexFormat = IndexFormat::UInt16;
    std::vector<glm::vec3> vertices;
    std::vector<uint32_t> triangles;
    std::optional<std::vector<glm::vec3>> normals;
    std::array<std::optional<std::vector<glm::vec2>>, UV_CHANNELS> uvs;
    std::optional<std::vector<glm::vec4>> colors;
    std::optional<std::vector<glm::vec4>> tangents;
    BoundingBox bounds;
    std::string name;

    static void checkChannel(int channel);
};

class HeadlessHostMeshFactory : public HostMeshFactory {
    size_t created = 0;
public:
    HostMeshHandle create() override;
    size_t getCreatedCount() const { return created; }
};
