#pragma once
#include "GeometryBuffer.hpp"
#include "GeometrySettings.hpp"
#include "HostMesh.hpp"
#include "HostThreadToken.hpp"

/**
 * The only place GeometryBuffer and host meshes meet. Both directions touch a
 * thread-affine host resource and must run on the host's designated thread;
 * the HostThreadToken argument documents that obligation.
 */
class HostMeshGateway {
public:
    explicit HostMeshGateway(HostMeshFactory &factory, GeometrySettings settings = GeometrySettings());

    /**
     * Builds a host mesh from buffer. Indices are UInt32 once the buffer has
     * WIDE_INDEX_VERTEX_THRESHOLD vertices whatever the hint says. Absent
     * channels stay unset. If buffer.tracker is set it receives the mesh.
     * Throws GeometryException for a structurally invalid buffer, before any
     * host mesh is created.
     */
    HostMeshHandle toHostMesh(const GeometryBuffer &buffer, const HostThreadToken &token) const;

    // Copies every field of mesh. Throws std::invalid_argument when mesh is null.
    GeometryBuffer fromHostMesh(const HostMesh *mesh, const HostThreadToken &token) const;

    const GeometrySettings &getSettings() const;

private:
    HostMeshFactory &factory;
    GeometrySettings settings;
};
