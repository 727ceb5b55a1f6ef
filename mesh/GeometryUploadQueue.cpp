#include "mesh.hpp"

GeometryUploadQueue::GeometryUploadQueue(const HostMeshGateway &gateway) : gateway(gateway) {
}

void GeometryUploadQueue::push(GeometryBuffer buffer) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(buffer));
}

bool GeometryUploadQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

size_t GeometryUploadQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool GeometryUploadQueue::tryPop(GeometryBuffer &out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty())
        return false;
    out = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

size_t GeometryUploadQueue::drain(const HostThreadToken &token, const MeshCallback &onMesh) {
    const GeometrySettings &settings = gateway.getSettings();
    size_t limit = settings.maxUploadsPerDrain;

    size_t converted = 0;
    GeometryBuffer buffer;
    while ((limit == 0 || converted < limit) && tryPop(buffer)) {
        HostMeshHandle mesh = gateway.toHostMesh(buffer, token);
        ++converted;
        if (onMesh)
            onMesh(buffer, mesh);
    }

    if (settings.verbose && converted > 0) {
        fprintf(stderr, "[UPLOAD] converted %zu buffers, %zu pending\n", converted, size());
    }
    return converted;
}
