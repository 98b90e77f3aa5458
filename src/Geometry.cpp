#include <facet/Geometry.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace facet {

float AABB::intersect(const Ray& ray) const {
    // Slab method
    float tmin = -std::numeric_limits<float>::infinity();
    float tmax = std::numeric_limits<float>::infinity();

    for (int i = 0; i < 3; i++) {
        if (std::abs(ray.direction[i]) < 1e-8f) {
            // Ray is parallel to slab
            if (ray.origin[i] < min[i] || ray.origin[i] > max[i]) {
                return -1.0f;
            }
        } else {
            float invD = 1.0f / ray.direction[i];
            float t0 = (min[i] - ray.origin[i]) * invD;
            float t1 = (max[i] - ray.origin[i]) * invD;

            if (invD < 0.0f) {
                std::swap(t0, t1);
            }

            tmin = std::max(tmin, t0);
            tmax = std::min(tmax, t1);

            if (tmax < tmin) {
                return -1.0f;
            }
        }
    }

    // Entry point, or exit if the origin is inside
    return tmin >= 0 ? tmin : tmax;
}

} // namespace facet
