#pragma once

#include <glm/glm.hpp>

namespace facet {

struct Ray {
    glm::vec3 origin{0.0f};
    glm::vec3 direction{0.0f, 0.0f, -1.0f};

    glm::vec3 at(float t) const { return origin + direction * t; }
};

// Pixel dimensions of the view the cursor lives in
struct Viewport {
    float width = 1.0f;
    float height = 1.0f;

    float aspect() const { return height > 0.0f ? width / height : 1.0f; }
};

struct AABB {
    glm::vec3 min{0};
    glm::vec3 max{0};

    glm::vec3 getCenter() const { return (min + max) * 0.5f; }
    glm::vec3 getSize() const { return max - min; }

    void expand(const glm::vec3& point) {
        min = glm::min(min, point);
        max = glm::max(max, point);
    }

    // Grow by a margin on every side
    void pad(float margin) {
        min -= glm::vec3(margin);
        max += glm::vec3(margin);
    }

    // Ray-AABB intersection test, returns distance or -1 if no hit
    float intersect(const Ray& ray) const;
};

} // namespace facet
