#include <facet/Extruder.hpp>
#include <glm/gtc/quaternion.hpp>
#include <cmath>
#include <unordered_map>

namespace facet {

ExtrudeFrame computeExtrudeFrame(const EditMesh& mesh, const FaceSet& faces) {
    ExtrudeFrame frame;
    glm::vec3 weightedNormal(0.0f);
    glm::vec3 weightedCenter(0.0f);
    glm::vec3 plainCenter(0.0f);
    uint32_t count = 0;

    for (FaceIndex face : faces) {
        if (!mesh.isValidFace(face)) continue;

        float area = mesh.getFaceArea(face);
        glm::vec3 center = mesh.getFaceCenter(face);
        weightedNormal += mesh.getFaceNormal(face) * area;
        weightedCenter += center * area;
        plainCenter += center;
        frame.totalArea += area;
        count++;
    }

    if (count == 0) return frame;

    if (frame.totalArea > 1e-12f) {
        frame.centroid = weightedCenter / frame.totalArea;
    } else {
        frame.centroid = plainCenter / static_cast<float>(count);
    }

    float len = glm::length(weightedNormal);
    frame.normal = len > 1e-12f ? weightedNormal / len : glm::vec3(0.0f);
    return frame;
}

glm::vec3 tiltedDirection(const glm::vec3& normal, float angleDegrees) {
    if (std::abs(angleDegrees) < 1e-6f || glm::dot(normal, normal) < 1e-12f) {
        return normal;
    }

    // Tilt axis lies in the extrusion plane; horizontal unless the normal is vertical
    glm::vec3 axis = glm::cross(normal, glm::vec3(0, 1, 0));
    if (glm::length(axis) < 1e-4f) {
        axis = glm::vec3(1, 0, 0);
    }
    axis = glm::normalize(axis);

    glm::quat rotation = glm::angleAxis(glm::radians(angleDegrees), axis);
    return glm::normalize(rotation * normal);
}

EditMesh extrudeFaces(const EditMesh& mesh, const FaceSet& faces, float distance, float angleDegrees) {
    FaceSet selected;
    for (FaceIndex face : faces) {
        if (mesh.isValidFace(face)) selected.insert(face);
    }
    if (selected.empty()) return mesh;

    ExtrudeFrame frame = computeExtrudeFrame(mesh, selected);
    glm::vec3 offset = tiltedDirection(frame.normal, angleDegrees) * distance;

    std::vector<Vertex> vertices = mesh.getVertices();
    std::vector<Triangle> triangles;
    triangles.reserve(mesh.getFaceCount() + selected.size() * 2);

    // Duplicate each vertex of the selected region once
    std::unordered_map<uint32_t, uint32_t> capVertex;
    for (FaceIndex face : selected) {
        for (uint32_t idx : mesh.getTriangles()[face]) {
            if (capVertex.count(idx)) continue;
            Vertex dup = vertices[idx];
            dup.position += offset;
            capVertex[idx] = static_cast<uint32_t>(vertices.size());
            vertices.push_back(dup);
        }
    }

    // Count how many selected triangles use each edge, keeping the first
    // directed occurrence for the wall winding
    struct EdgeUse {
        uint32_t from;
        uint32_t to;
        int count;
    };
    std::unordered_map<uint64_t, EdgeUse> edgeUses;
    std::vector<uint64_t> edgeOrder;

    for (FaceIndex face = 0; face < mesh.getFaceCount(); ++face) {
        const Triangle& tri = mesh.getTriangles()[face];
        if (!selected.count(face)) {
            triangles.push_back(tri);
            continue;
        }

        triangles.push_back({capVertex[tri[0]], capVertex[tri[1]], capVertex[tri[2]]});

        for (const auto& [a, b] : mesh.getFaceEdges(face)) {
            uint64_t key = makeEdgeKey(a, b);
            auto it = edgeUses.find(key);
            if (it == edgeUses.end()) {
                edgeUses.emplace(key, EdgeUse{a, b, 1});
                edgeOrder.push_back(key);
            } else {
                it->second.count++;
            }
        }
    }

    // Boundary edges get a quad wall facing away from the region
    for (uint64_t key : edgeOrder) {
        const EdgeUse& edge = edgeUses[key];
        if (edge.count != 1) continue;

        uint32_t ea = edge.from;
        uint32_t eb = edge.to;
        uint32_t eaCap = capVertex[ea];
        uint32_t ebCap = capVertex[eb];

        triangles.push_back({ea, eb, ebCap});
        triangles.push_back({ea, ebCap, eaCap});
    }

    // Interior vertices of the region are only referenced by the old cap
    EditMesh result(std::move(vertices), std::move(triangles));
    result.removeUnusedVertices();
    result.recalculateNormals();
    return result;
}

} // namespace facet
