#include <facet/Cutter.hpp>

namespace facet {

// Copy a subset of triangles with only the vertices they use, renumbered
static EditMesh compactSubset(const EditMesh& mesh, const std::vector<FaceIndex>& subset) {
    const auto& sourceVertices = mesh.getVertices();
    std::vector<uint32_t> remap(sourceVertices.size(), UINT32_MAX);

    std::vector<Vertex> vertices;
    std::vector<Triangle> triangles;
    triangles.reserve(subset.size());

    for (FaceIndex face : subset) {
        Triangle tri = mesh.getTriangles()[face];
        for (uint32_t& idx : tri) {
            if (remap[idx] == UINT32_MAX) {
                remap[idx] = static_cast<uint32_t>(vertices.size());
                vertices.push_back(sourceVertices[idx]);
            }
            idx = remap[idx];
        }
        triangles.push_back(tri);
    }

    EditMesh result(std::move(vertices), std::move(triangles));
    result.recalculateNormals();
    return result;
}

CutResult cutFaces(const EditMesh& mesh, const FaceSet& faces) {
    std::vector<FaceIndex> inside;
    std::vector<FaceIndex> outside;

    for (FaceIndex face = 0; face < mesh.getFaceCount(); ++face) {
        if (faces.count(face)) {
            inside.push_back(face);
        } else {
            outside.push_back(face);
        }
    }

    CutResult result;
    result.remaining = compactSubset(mesh, outside);
    result.cutOut = compactSubset(mesh, inside);
    return result;
}

EditMesh deleteFaces(const EditMesh& mesh, const FaceSet& faces) {
    std::vector<Triangle> kept;
    kept.reserve(mesh.getFaceCount());
    for (FaceIndex face = 0; face < mesh.getFaceCount(); ++face) {
        if (!faces.count(face)) {
            kept.push_back(mesh.getTriangles()[face]);
        }
    }

    EditMesh result(mesh.getVertices(), std::move(kept));
    result.removeUnusedVertices();
    result.recalculateNormals();
    return result;
}

} // namespace facet
