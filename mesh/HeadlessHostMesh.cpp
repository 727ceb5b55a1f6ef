#include "mesh.hpp"

void HeadlessHostMesh::checkChannel(int channel) {
    if (channel < 0 || channel >= UV_CHANNELS) {
        throw std::invalid_argument("HeadlessHostMesh: uv channel " + std::to_string(channel) + " out of range");
    }
}

void HeadlessHostMesh::setIndexFormat(IndexFormat format) {
    this->indexFormat = format;
}

IndexFormat HeadlessHostMesh::getIndexFormat() const {
    return indexFormat;
}

void HeadlessHostMesh::setVertices(const std::vector<glm::vec3> &vertices) {
    this->vertices = vertices;
}

std::vector<glm::vec3> HeadlessHostMesh::getVertices() const {
    return vertices;
}

void HeadlessHostMesh::setTriangles(const std::vector<uint32_t> &triangles) {
    this->triangles = triangles;
}

std::vector<uint32_t> HeadlessHostMesh::getTriangles() const {
    return triangles;
}

void HeadlessHostMesh::setNormals(const std::vector<glm::vec3> &normals) {
    this->normals = normals;
}

std::optional<std::vector<glm::vec3>> HeadlessHostMesh::getNormals() const {
    return normals;
}

void HeadlessHostMesh::setUVs(int channel, const std::vector<glm::vec2> &uvs) {
    checkChannel(channel);
    this->uvs[channel] = uvs;
}

std::optional<std::vector<glm::vec2>> HeadlessHostMesh::getUVs(int channel) const {
    checkChannel(channel);
    return uvs[channel];
}

void HeadlessHostMesh::setColors(const std::vector<glm::vec4> &colors) {
    this->colors = colors;
}

std::optional<std::vector<glm::vec4>> HeadlessHostMesh::getColors() const {
    return colors;
}

void HeadlessHostMesh::setTangents(const std::vector<glm::vec4> &tangents) {
    this->tangents = tangents;
}

std::optional<std::vector<glm::vec4>> HeadlessHostMesh::getTangents() const {
    return tangents;
}

void HeadlessHostMesh::setBounds(const BoundingBox &bounds) {
    this->bounds = bounds;
}

BoundingBox HeadlessHostMesh::getBounds() const {
    return bounds;
}

void HeadlessHostMesh::setName(const std::string &name) {
    this->name = name;
}

std::string HeadlessHostMesh::getName() const {
    return name;
}

HostMeshHandle HeadlessHostMeshFactory::create() {
    ++created;
    return std::make_shared<HeadlessHostMesh>();
}
