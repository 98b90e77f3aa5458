#pragma once

#include "Geometry.hpp"

#include <glm/glm.hpp>
#include <array>
#include <cstdint>
#include <vector>

namespace facet {

enum class PrimitiveTopology {
    TriangleList,
    TriangleStrip,
    LineList,
    PointList
};

// Buffer contract shared with the host renderer. Normals and UVs are optional
// (empty), indices are optional (empty = non-indexed triangle list).
struct RenderableMesh {
    PrimitiveTopology topology = PrimitiveTopology::TriangleList;
    std::vector<glm::vec3> positions;
    std::vector<glm::vec3> normals;
    std::vector<glm::vec2> uvs;
    std::vector<uint32_t> indices;

    bool isIndexed() const { return !indices.empty(); }
    uint32_t getVertexCount() const { return static_cast<uint32_t>(positions.size()); }
};

// Trimesh collider data handed to the host physics layer
struct CollisionShape {
    std::vector<glm::vec3> vertices;
    std::vector<std::array<uint32_t, 3>> triangles;
    AABB bounds;

    bool empty() const { return triangles.empty(); }
};

} // namespace facet
