#include <facet/FacePicker.hpp>
#include <cmath>
#include <limits>

namespace facet {

static constexpr float kPickEpsilon = 1e-7f;

std::optional<FaceHit> pickFace(const EditMesh& mesh, const Ray& localRay, bool xray) {
    if (mesh.empty()) return std::nullopt;

    const glm::vec3& origin = localRay.origin;
    const glm::vec3& dir = localRay.direction;

    AABB bounds = mesh.getBounds();
    bounds.pad(1e-4f);
    if (bounds.intersect(localRay) < 0.0f) {
        return std::nullopt;
    }

    const auto& vertices = mesh.getVertices();
    const auto& triangles = mesh.getTriangles();

    std::optional<FaceHit> result;
    float closestDist = std::numeric_limits<float>::max();

    for (FaceIndex faceIdx = 0; faceIdx < triangles.size(); ++faceIdx) {
        const Triangle& tri = triangles[faceIdx];
        glm::vec3 v0 = vertices[tri[0]].position;
        glm::vec3 v1 = vertices[tri[1]].position;
        glm::vec3 v2 = vertices[tri[2]].position;

        glm::vec3 edge1 = v1 - v0;
        glm::vec3 edge2 = v2 - v0;

        // Back-face rejection happens before the hit is considered at all
        if (!xray && glm::dot(glm::cross(edge1, edge2), dir) >= 0.0f) continue;

        // Moller-Trumbore intersection
        glm::vec3 h = glm::cross(dir, edge2);
        float a = glm::dot(edge1, h);
        if (std::abs(a) < kPickEpsilon) continue;

        float f = 1.0f / a;
        glm::vec3 s = origin - v0;
        float u = f * glm::dot(s, h);
        if (u < 0.0f || u > 1.0f) continue;

        glm::vec3 q = glm::cross(s, edge1);
        float v = f * glm::dot(dir, q);
        if (v < 0.0f || u + v > 1.0f) continue;

        float t = f * glm::dot(edge2, q);
        if (t > kPickEpsilon && t < closestDist) {
            closestDist = t;
            FaceHit hit;
            hit.face = faceIdx;
            hit.point = origin + dir * t;
            hit.distance = t;
            result = hit;
        }
    }

    return result;
}

std::optional<FaceHit> pickFaceWorld(const EditMesh& mesh, const Transform& transform,
                                     const Ray& worldRay, bool xray) {
    // The local direction is not renormalized, so t is the same parameter on both rays
    auto hit = pickFace(mesh, transform.worldToLocal(worldRay), xray);
    if (hit) {
        hit->distance *= glm::length(worldRay.direction);
    }
    return hit;
}

} // namespace facet
