#include "TestMeshes.hpp"

namespace facet::test {

RenderableMesh makeCubeRenderable() {
    RenderableMesh mesh;
    mesh.positions = {
        {-0.5f, -0.5f, -0.5f}, {0.5f, -0.5f, -0.5f}, {0.5f, 0.5f, -0.5f}, {-0.5f, 0.5f, -0.5f},
        {-0.5f, -0.5f,  0.5f}, {0.5f, -0.5f,  0.5f}, {0.5f, 0.5f,  0.5f}, {-0.5f, 0.5f,  0.5f},
    };
    mesh.indices = {
        4, 5, 6,  4, 6, 7,   // +Z
        0, 2, 1,  0, 3, 2,   // -Z
        1, 2, 6,  1, 6, 5,   // +X
        0, 4, 7,  0, 7, 3,   // -X
        3, 7, 6,  3, 6, 2,   // +Y
        0, 1, 5,  0, 5, 4,   // -Y
    };
    return mesh;
}

EditMesh makeCube() {
    return *EditMesh::fromRenderable(makeCubeRenderable());
}

RenderableMesh makeGridRenderable(int n, float size) {
    RenderableMesh mesh;
    const float step = size / static_cast<float>(n);
    for (int j = 0; j <= n; ++j) {
        for (int i = 0; i <= n; ++i) {
            glm::vec3 p(i * step, j * step, 0.0f);
            mesh.positions.push_back(p);
            mesh.normals.push_back({0.0f, 0.0f, 1.0f});
            mesh.uvs.push_back(glm::vec2(p) / size);
        }
    }

    const uint32_t stride = static_cast<uint32_t>(n + 1);
    for (int j = 0; j < n; ++j) {
        for (int i = 0; i < n; ++i) {
            uint32_t v00 = j * stride + i;
            uint32_t v10 = v00 + 1;
            uint32_t v01 = v00 + stride;
            uint32_t v11 = v01 + 1;
            mesh.indices.insert(mesh.indices.end(), {v00, v10, v11, v00, v11, v01});
        }
    }
    return mesh;
}

EditMesh makeGrid(int n, float size) {
    return *EditMesh::fromRenderable(makeGridRenderable(n, size));
}

} // namespace facet::test
