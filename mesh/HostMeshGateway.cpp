#include "mesh.hpp"

HostMeshGateway::HostMeshGateway(HostMeshFactory &factory, GeometrySettings settings)
    : factory(factory), settings(settings) {
}

const GeometrySettings &HostMeshGateway::getSettings() const {
    return settings;
}

HostMeshHandle HostMeshGateway::toHostMesh(const GeometryBuffer &buffer, const HostThreadToken &token) const {
    buffer.validate();

    if (settings.verbose && !token.isOwnerThread()) {
        fprintf(stderr, "[GATEWAY] '%s': converting off the designated thread\n", buffer.name.c_str());
    }

    HostMeshHandle mesh = factory.create();
    if (!mesh) {
        throw std::runtime_error("HostMeshGateway: factory returned no mesh for '" + buffer.name + "'");
    }

    IndexFormat format = buffer.effectiveIndexFormat();
    if (settings.verbose && format != buffer.indexFormat) {
        fprintf(stderr, "[GATEWAY] '%s': %zu vertices, index format forced to %s\n",
            buffer.name.c_str(), buffer.vertexCount(), toString(format));
    }
    mesh->setIndexFormat(format);

    // vertices first, hosts check triangles against them
    if (!buffer.vertices.empty())
        mesh->setVertices(buffer.vertices);
    if (!buffer.triangles.empty())
        mesh->setTriangles(buffer.triangles);

    if (buffer.normals)
        mesh->setNormals(*buffer.normals);
    for (int c = 0; c < GeometryBuffer::UV_CHANNELS; ++c) {
        if (buffer.uvs[c])
            mesh->setUVs(c, *buffer.uvs[c]);
    }
    if (buffer.colors)
        mesh->setColors(*buffer.colors);
    if (buffer.tangents)
        mesh->setTangents(*buffer.tangents);

    mesh->setBounds(buffer.bounds);
    mesh->setName(buffer.name);

    if (buffer.tracker != nullptr)
        buffer.tracker->setMesh(mesh);

    return mesh;
}

GeometryBuffer HostMeshGateway::fromHostMesh(const HostMesh *mesh, const HostThreadToken &token) const {
    if (mesh == nullptr) {
        throw std::invalid_argument("HostMeshGateway: source mesh is null");
    }

    GeometryBuffer buffer(mesh->getName());
    if (settings.verbose && !token.isOwnerThread()) {
        fprintf(stderr, "[GATEWAY] '%s': reading off the designated thread\n", buffer.name.c_str());
    }

    buffer.indexFormat = mesh->getIndexFormat();
    buffer.vertices = mesh->getVertices();
    buffer.triangles = mesh->getTriangles();
    buffer.normals = mesh->getNormals();
    for (int c = 0; c < GeometryBuffer::UV_CHANNELS; ++c) {
        buffer.uvs[c] = mesh->getUVs(c);
    }
    buffer.colors = mesh->getColors();
    buffer.tangents = mesh->getTangents();
    buffer.bounds = mesh->getBounds();
    return buffer;
}
