#pragma once
#include <glm/glm.hpp>

// Axis-aligned box stored as its min and max corners.
class BoundingBox {
    glm::vec3 min;
    glm::vec3 max;
public:
    BoundingBox();
    BoundingBox(glm::vec3 min, glm::vec3 max);
    static BoundingBox fromCenterAndSize(glm::vec3 center, glm::vec3 size);

    glm::vec3 getMin() const;
    glm::vec3 getMax() const;
    void setMin(glm::vec3 v);
    void setMax(glm::vec3 v);

    glm::vec3 getCenter() const;
    // Edge lengths, max - min.
    glm::vec3 getLength() const;

    void encapsulate(const glm::vec3 &point);
    bool contains(const glm::vec3 &point) const;
    bool contains(const BoundingBox &box) const;
    bool intersects(const BoundingBox &box) const;

    bool operator==(const BoundingBox &other) const;
    bool operator!=(const BoundingBox &other) const;
};
