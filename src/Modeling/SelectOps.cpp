#include <facet/SelectOps.hpp>
#include <facet/Extruder.hpp>
#include <cmath>
#include <queue>

namespace facet {

static FaceSet validFaces(const EditMesh& mesh, const FaceSet& faces) {
    FaceSet result;
    for (FaceIndex face : faces) {
        if (mesh.isValidFace(face)) result.insert(face);
    }
    return result;
}

FaceSet growSelection(const EditMesh& mesh, const FaceSet& faces) {
    FaceSet result = validFaces(mesh, faces);
    if (result.empty()) return result;

    const EdgeAdjacency adjacency = mesh.buildAdjacency();
    FaceSet seeds = result;
    for (FaceIndex face : seeds) {
        for (const auto& [a, b] : mesh.getFaceEdges(face)) {
            for (FaceIndex neighbor : adjacency.at(makeEdgeKey(a, b))) {
                result.insert(neighbor);
            }
        }
    }
    return result;
}

FaceSet shrinkSelection(const EditMesh& mesh, const FaceSet& faces) {
    FaceSet selected = validFaces(mesh, faces);
    FaceSet result;
    if (selected.empty()) return result;

    const EdgeAdjacency adjacency = mesh.buildAdjacency();
    for (FaceIndex face : selected) {
        bool interior = true;
        for (const auto& [a, b] : mesh.getFaceEdges(face)) {
            const auto& users = adjacency.at(makeEdgeKey(a, b));
            if (users.size() < 2) {
                interior = false;
                break;
            }
            for (FaceIndex neighbor : users) {
                if (!selected.count(neighbor)) {
                    interior = false;
                    break;
                }
            }
            if (!interior) break;
        }
        if (interior) result.insert(face);
    }
    return result;
}

FaceSet selectLinked(const EditMesh& mesh, const FaceSet& faces) {
    FaceSet result = validFaces(mesh, faces);
    if (result.empty()) return result;

    const EdgeAdjacency adjacency = mesh.buildAdjacency();
    std::queue<FaceIndex> frontier;
    for (FaceIndex face : result) frontier.push(face);

    while (!frontier.empty()) {
        FaceIndex current = frontier.front();
        frontier.pop();

        for (const auto& [a, b] : mesh.getFaceEdges(current)) {
            for (FaceIndex neighbor : adjacency.at(makeEdgeKey(a, b))) {
                if (result.insert(neighbor).second) {
                    frontier.push(neighbor);
                }
            }
        }
    }
    return result;
}

FaceSet selectByNormal(const EditMesh& mesh, const FaceSet& faces, float angleDegrees) {
    FaceSet selected = validFaces(mesh, faces);
    if (selected.empty()) return selected;

    glm::vec3 average = computeExtrudeFrame(mesh, selected).normal;
    if (glm::dot(average, average) < 1e-12f) return selected;

    const float cosThreshold = std::cos(glm::radians(angleDegrees));
    FaceSet result;
    for (FaceIndex face = 0; face < mesh.getFaceCount(); ++face) {
        if (glm::dot(mesh.getFaceNormal(face), average) >= cosThreshold) {
            result.insert(face);
        }
    }
    return result;
}

} // namespace facet
