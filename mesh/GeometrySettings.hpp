#pragma once
#include <glm/glm.hpp>
#include <cstddef>

class GeometrySettings {
public:
    GeometrySettings() { resetToDefaults(); }

    void resetToDefaults() {
        weldTolerance = 0.0001f;
        degenerateNormal = glm::vec3(0.0f);
        maxUploadsPerDrain = 0;
        verbose = false;
    }

    // Welding: relative equality tolerance and hash bucket width
    float weldTolerance = 0.0001f;

    // Normal written for vertices whose accumulated normal has no length
    glm::vec3 degenerateNormal = glm::vec3(0.0f);

    // Upload queue, 0 converts everything pending
    size_t maxUploadsPerDrain = 0;

    // Debug
    bool verbose = false;
};
