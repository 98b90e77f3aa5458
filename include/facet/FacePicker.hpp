#pragma once

#include "EditMesh.hpp"
#include "Geometry.hpp"
#include "Transform.hpp"

#include <glm/glm.hpp>
#include <optional>

namespace facet {

struct FaceHit {
    FaceIndex face = UINT32_MAX;
    glm::vec3 point{0.0f};   // Local space
    float distance = 0.0f;   // Ray parameter, in units of the ray direction
};

/**
 * @brief Closest triangle under a local-space ray.
 *
 * With xray off, triangles facing away from the ray origin are skipped before
 * any distance comparison. Only hits in front of the origin count.
 */
std::optional<FaceHit> pickFace(const EditMesh& mesh, const Ray& localRay, bool xray);

// World ray variant. The hit point stays in local space; distance is measured
// along the world ray.
std::optional<FaceHit> pickFaceWorld(const EditMesh& mesh, const Transform& transform,
                                     const Ray& worldRay, bool xray);

} // namespace facet
