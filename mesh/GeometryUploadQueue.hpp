#pragma once
#include "GeometryBuffer.hpp"
#include "HostMeshGateway.hpp"
#include <deque>
#include <functional>
#include <mutex>

/**
 * Hand-off between producers and the host's designated thread. Producers push
 * finished buffers from any thread; the designated thread drains them through
 * the gateway.
 */
class GeometryUploadQueue {
public:
    using MeshCallback = std::function<void(const GeometryBuffer &, HostMeshHandle)>;

    explicit GeometryUploadQueue(const HostMeshGateway &gateway);

    void push(GeometryBuffer buffer);
    bool empty() const;
    size_t size() const;

    /**
     * Converts pending buffers in push order, at most
     * GeometrySettings::maxUploadsPerDrain of them when that is non-zero, and
     * hands each result to onMesh. Designated thread only.
     * A buffer whose conversion throws is dropped and the exception
     * propagates; buffers behind it stay queued.
     */
    size_t drain(const HostThreadToken &token, const MeshCallback &onMesh);

private:
    bool tryPop(GeometryBuffer &out);

    const HostMeshGateway &gateway;
    mutable std::mutex mutex_;
    std::deque<GeometryBuffer> queue_;
};
