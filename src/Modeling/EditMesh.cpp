#include <facet/EditMesh.hpp>
#include <algorithm>
#include <iostream>

namespace facet {

EditMesh::EditMesh(std::vector<Vertex> vertices, std::vector<Triangle> triangles)
    : m_vertices(std::move(vertices))
{
    const size_t vertexCount = m_vertices.size();
    m_triangles.reserve(triangles.size());
    for (const auto& tri : triangles) {
        if (tri[0] < vertexCount && tri[1] < vertexCount && tri[2] < vertexCount) {
            m_triangles.push_back(tri);
        }
    }
}

std::optional<EditMesh> EditMesh::fromRenderable(const RenderableMesh& mesh) {
    if (mesh.topology != PrimitiveTopology::TriangleList) {
        std::cerr << "[EditMesh] Unsupported topology, only triangle lists can be edited" << std::endl;
        return std::nullopt;
    }
    if (mesh.positions.empty()) {
        std::cerr << "[EditMesh] Mesh has no position data" << std::endl;
        return std::nullopt;
    }

    const size_t vertexCount = mesh.positions.size();
    bool hasNormals = !mesh.normals.empty();
    bool hasUVs = !mesh.uvs.empty();

    if ((hasNormals && mesh.normals.size() != vertexCount) ||
        (hasUVs && mesh.uvs.size() != vertexCount)) {
        std::cerr << "[EditMesh] Attribute count does not match position count" << std::endl;
        return std::nullopt;
    }

    std::vector<Vertex> vertices(vertexCount);
    for (size_t i = 0; i < vertexCount; ++i) {
        vertices[i].position = mesh.positions[i];
        vertices[i].normal = hasNormals ? mesh.normals[i] : glm::vec3(0.0f);
        vertices[i].uv = hasUVs ? mesh.uvs[i] : glm::vec2(0.0f);
    }

    std::vector<Triangle> triangles;
    if (mesh.isIndexed()) {
        if (mesh.indices.size() % 3 != 0) {
            std::cerr << "[EditMesh] Index count " << mesh.indices.size() << " is not a multiple of 3" << std::endl;
            return std::nullopt;
        }
        triangles.reserve(mesh.indices.size() / 3);
        for (size_t i = 0; i < mesh.indices.size(); i += 3) {
            Triangle tri = {mesh.indices[i], mesh.indices[i + 1], mesh.indices[i + 2]};
            if (tri[0] >= vertexCount || tri[1] >= vertexCount || tri[2] >= vertexCount) {
                std::cerr << "[EditMesh] Triangle " << i / 3 << " references a missing vertex" << std::endl;
                return std::nullopt;
            }
            triangles.push_back(tri);
        }
    } else {
        if (vertexCount % 3 != 0) {
            std::cerr << "[EditMesh] Non-indexed vertex count " << vertexCount << " is not a multiple of 3" << std::endl;
            return std::nullopt;
        }
        triangles.reserve(vertexCount / 3);
        for (uint32_t i = 0; i < vertexCount; i += 3) {
            triangles.push_back({i, i + 1, i + 2});
        }
    }

    EditMesh result(std::move(vertices), std::move(triangles));
    if (!hasNormals) {
        result.recalculateNormals();
    }
    return result;
}

RenderableMesh EditMesh::toRenderable() const {
    RenderableMesh mesh;
    mesh.topology = PrimitiveTopology::TriangleList;
    mesh.positions.reserve(m_vertices.size());
    mesh.normals.reserve(m_vertices.size());
    mesh.uvs.reserve(m_vertices.size());

    for (const auto& v : m_vertices) {
        mesh.positions.push_back(v.position);
        mesh.normals.push_back(v.normal);
        mesh.uvs.push_back(v.uv);
    }

    mesh.indices.reserve(m_triangles.size() * 3);
    for (const auto& tri : m_triangles) {
        mesh.indices.insert(mesh.indices.end(), tri.begin(), tri.end());
    }
    return mesh;
}

CollisionShape EditMesh::toCollisionShape() const {
    CollisionShape shape;
    shape.vertices.reserve(m_vertices.size());
    for (const auto& v : m_vertices) {
        shape.vertices.push_back(v.position);
    }
    shape.triangles = m_triangles;
    shape.bounds = getBounds();
    return shape;
}

glm::vec3 EditMesh::getFaceNormal(FaceIndex face) const {
    if (!isValidFace(face)) return glm::vec3(0.0f);

    const Triangle& tri = m_triangles[face];
    glm::vec3 v0 = m_vertices[tri[0]].position;
    glm::vec3 v1 = m_vertices[tri[1]].position;
    glm::vec3 v2 = m_vertices[tri[2]].position;

    glm::vec3 n = glm::cross(v1 - v0, v2 - v0);
    float len = glm::length(n);
    if (len < 1e-12f) return glm::vec3(0.0f);
    return n / len;
}

glm::vec3 EditMesh::getFaceCenter(FaceIndex face) const {
    if (!isValidFace(face)) return glm::vec3(0.0f);

    const Triangle& tri = m_triangles[face];
    return (m_vertices[tri[0]].position +
            m_vertices[tri[1]].position +
            m_vertices[tri[2]].position) / 3.0f;
}

float EditMesh::getFaceArea(FaceIndex face) const {
    if (!isValidFace(face)) return 0.0f;

    const Triangle& tri = m_triangles[face];
    glm::vec3 v0 = m_vertices[tri[0]].position;
    glm::vec3 v1 = m_vertices[tri[1]].position;
    glm::vec3 v2 = m_vertices[tri[2]].position;
    return glm::length(glm::cross(v1 - v0, v2 - v0)) * 0.5f;
}

glm::vec2 EditMesh::getFaceUVCenter(FaceIndex face) const {
    if (!isValidFace(face)) return glm::vec2(0.0f);

    const Triangle& tri = m_triangles[face];
    return (m_vertices[tri[0]].uv + m_vertices[tri[1]].uv + m_vertices[tri[2]].uv) / 3.0f;
}

std::array<std::pair<uint32_t, uint32_t>, 3> EditMesh::getFaceEdges(FaceIndex face) const {
    const Triangle& tri = m_triangles.at(face);
    return {{{tri[0], tri[1]}, {tri[1], tri[2]}, {tri[2], tri[0]}}};
}

EdgeAdjacency EditMesh::buildAdjacency() const {
    EdgeAdjacency adjacency;
    adjacency.reserve(m_triangles.size() * 3 / 2 + 1);

    for (FaceIndex face = 0; face < m_triangles.size(); ++face) {
        for (const auto& [a, b] : getFaceEdges(face)) {
            adjacency[makeEdgeKey(a, b)].push_back(face);
        }
    }
    return adjacency;
}

AABB EditMesh::getBounds() const {
    AABB bounds;
    if (m_vertices.empty()) return bounds;

    bounds.min = bounds.max = m_vertices[0].position;
    for (const auto& v : m_vertices) {
        bounds.expand(v.position);
    }
    return bounds;
}

void EditMesh::recalculateNormals() {
    for (auto& v : m_vertices) {
        v.normal = glm::vec3(0);
    }

    // Unnormalized cross product weights each face by its area
    for (const auto& tri : m_triangles) {
        glm::vec3 v0 = m_vertices[tri[0]].position;
        glm::vec3 v1 = m_vertices[tri[1]].position;
        glm::vec3 v2 = m_vertices[tri[2]].position;
        glm::vec3 n = glm::cross(v1 - v0, v2 - v0);
        for (uint32_t idx : tri) {
            m_vertices[idx].normal += n;
        }
    }

    for (auto& v : m_vertices) {
        float len = glm::length(v.normal);
        v.normal = len > 1e-12f ? v.normal / len : glm::vec3(0.0f);
    }
}

size_t EditMesh::removeUnusedVertices() {
    std::vector<bool> used(m_vertices.size(), false);
    for (const auto& tri : m_triangles) {
        for (uint32_t idx : tri) {
            used[idx] = true;
        }
    }

    std::vector<uint32_t> remap(m_vertices.size(), UINT32_MAX);
    std::vector<Vertex> kept;
    kept.reserve(m_vertices.size());
    for (size_t i = 0; i < m_vertices.size(); ++i) {
        if (!used[i]) continue;
        remap[i] = static_cast<uint32_t>(kept.size());
        kept.push_back(m_vertices[i]);
    }

    const size_t removed = m_vertices.size() - kept.size();
    if (removed == 0) return 0;

    for (auto& tri : m_triangles) {
        for (uint32_t& idx : tri) {
            idx = remap[idx];
        }
    }
    m_vertices = std::move(kept);
    return removed;
}

} // namespace facet
