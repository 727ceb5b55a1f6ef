#include "math.hpp"

BoundingBox::BoundingBox() : min(glm::vec3(0.0f)), max(glm::vec3(0.0f)) {
}

BoundingBox::BoundingBox(glm::vec3 min, glm::vec3 max) : min(min), max(max) {
}

BoundingBox BoundingBox::fromCenterAndSize(glm::vec3 center, glm::vec3 size) {
    glm::vec3 half = size * 0.5f;
    return BoundingBox(center - half, center + half);
}

glm::vec3 BoundingBox::getMin() const {
    return min;
}

glm::vec3 BoundingBox::getMax() const {
    return max;
}

void BoundingBox::setMin(glm::vec3 v) {
    this->min = v;
}

void BoundingBox::setMax(glm::vec3 v) {
    this->max = v;
}

glm::vec3 BoundingBox::getCenter() const {
    return (min + max) * 0.5f;
}

glm::vec3 BoundingBox::getLength() const {
    return max - min;
}

void BoundingBox::encapsulate(const glm::vec3 &point) {
    min = glm::min(min, point);
    max = glm::max(max, point);
}

bool BoundingBox::contains(const glm::vec3 &point) const {
    return
        Math::isBetween(point[0], min[0], max[0]) &&
        Math::isBetween(point[1], min[1], max[1]) &&
        Math::isBetween(point[2], min[2], max[2]);
}

bool BoundingBox::contains(const BoundingBox &box) const {
    glm::vec3 minC = box.getMin();
    glm::vec3 maxC = box.getMax();

    return min[0] <= minC[0] && maxC[0] <= max[0] &&
           min[1] <= minC[1] && maxC[1] <= max[1] &&
           min[2] <= minC[2] && maxC[2] <= max[2];
}

bool BoundingBox::intersects(const BoundingBox &box) const {
    glm::vec3 minBox = box.getMin();
    glm::vec3 maxBox = box.getMax();

    for (int i = 0; i < 3; ++i) {
        if (max[i] < minBox[i] || min[i] > maxBox[i])
            return false;
    }
    return true;
}

bool BoundingBox::operator==(const BoundingBox &other) const {
    return min == other.min && max == other.max;
}

bool BoundingBox::operator!=(const BoundingBox &other) const {
    return !(*this == other);
}
