#pragma once

#include "Geometry.hpp"
#include "RenderableMesh.hpp"

#include <glm/glm.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <set>
#include <unordered_map>
#include <utility>
#include <vector>

namespace facet {

struct Vertex {
    glm::vec3 position{0.0f};
    glm::vec3 normal{0.0f};
    glm::vec2 uv{0.0f};
};

using Triangle = std::array<uint32_t, 3>;
using FaceIndex = uint32_t;
using FaceSet = std::set<FaceIndex>;

// Undirected edge between two vertex indices, smaller index in the high word
inline uint64_t makeEdgeKey(uint32_t v0, uint32_t v1) {
    if (v0 > v1) std::swap(v0, v1);
    return (static_cast<uint64_t>(v0) << 32) | v1;
}

using EdgeAdjacency = std::unordered_map<uint64_t, std::vector<FaceIndex>>;

// Editable triangle mesh in local space. Operations that change topology
// (extrude, cut, delete) build a new EditMesh instead of editing this one.
class EditMesh {
public:
    EditMesh() = default;
    EditMesh(std::vector<Vertex> vertices, std::vector<Triangle> triangles);

    // None for non-triangle-list topology, missing positions or bad indices.
    // Missing normals are recomputed, missing UVs are zero.
    static std::optional<EditMesh> fromRenderable(const RenderableMesh& mesh);

    RenderableMesh toRenderable() const;
    CollisionShape toCollisionShape() const;

    const std::vector<Vertex>& getVertices() const { return m_vertices; }
    const std::vector<Triangle>& getTriangles() const { return m_triangles; }
    uint32_t getVertexCount() const { return static_cast<uint32_t>(m_vertices.size()); }
    uint32_t getFaceCount() const { return static_cast<uint32_t>(m_triangles.size()); }
    bool empty() const { return m_triangles.empty(); }

    bool isValidFace(FaceIndex face) const { return face < m_triangles.size(); }

    // Unit normal from (v1 - v0) x (v2 - v0), zero for degenerate faces
    glm::vec3 getFaceNormal(FaceIndex face) const;
    glm::vec3 getFaceCenter(FaceIndex face) const;
    float getFaceArea(FaceIndex face) const;
    glm::vec2 getFaceUVCenter(FaceIndex face) const;

    // Directed edges in winding order: (v0,v1), (v1,v2), (v2,v0)
    std::array<std::pair<uint32_t, uint32_t>, 3> getFaceEdges(FaceIndex face) const;

    // Faces sharing each undirected edge
    EdgeAdjacency buildAdjacency() const;

    AABB getBounds() const;

    // Smooth vertex normals from area-weighted face normals
    void recalculateNormals();

    // Drop vertices no triangle references and renumber the rest in order.
    // Returns the number removed.
    size_t removeUnusedVertices();

private:
    std::vector<Vertex> m_vertices;
    std::vector<Triangle> m_triangles;
};

} // namespace facet
