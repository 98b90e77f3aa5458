#include <facet/RegionSelector.hpp>
#include <cmath>
#include <queue>

namespace facet {

GridType cycleGridType(GridType type) {
    switch (type) {
        case GridType::WorldSpace:   return GridType::SurfaceSpace;
        case GridType::SurfaceSpace: return GridType::UVSpace;
        case GridType::UVSpace:      return GridType::Freeform;
        case GridType::Freeform:     return GridType::WorldSpace;
    }
    return GridType::WorldSpace;
}

const char* gridTypeToString(GridType type) {
    switch (type) {
        case GridType::WorldSpace:   return "World Grid";
        case GridType::SurfaceSpace: return "Surface";
        case GridType::UVSpace:      return "UV Grid";
        case GridType::Freeform:     return "Freeform";
    }
    return "Unknown";
}

static glm::ivec3 worldCell(const glm::vec3& p, float cellSize) {
    return glm::ivec3(glm::floor(p / cellSize));
}

static glm::ivec2 uvCell(const glm::vec2& uv, float cellSize) {
    return glm::ivec2(glm::floor(uv / cellSize));
}

FaceSet worldGridSelect(const EditMesh& mesh, const Transform& transform,
                        float cellSize, const glm::vec3& worldPoint) {
    FaceSet result;
    if (cellSize <= 0.0f) return result;

    glm::ivec3 target = worldCell(worldPoint, cellSize);
    for (FaceIndex face = 0; face < mesh.getFaceCount(); ++face) {
        glm::vec3 center = transform.transformPoint(mesh.getFaceCenter(face));
        if (worldCell(center, cellSize) == target) {
            result.insert(face);
        }
    }
    return result;
}

FaceSet uvGridSelect(const EditMesh& mesh, FaceIndex clickedFace, float uvCellSize) {
    FaceSet result;
    if (uvCellSize <= 0.0f || !mesh.isValidFace(clickedFace)) return result;

    glm::ivec2 target = uvCell(mesh.getFaceUVCenter(clickedFace), uvCellSize);
    for (FaceIndex face = 0; face < mesh.getFaceCount(); ++face) {
        if (uvCell(mesh.getFaceUVCenter(face), uvCellSize) == target) {
            result.insert(face);
        }
    }
    return result;
}

FaceSet surfaceFloodSelect(const EditMesh& mesh, FaceIndex seed, float angleThresholdDegrees) {
    FaceSet result;
    if (!mesh.isValidFace(seed)) return result;

    const float cosThreshold = std::cos(glm::radians(angleThresholdDegrees));
    const glm::vec3 seedNormal = mesh.getFaceNormal(seed);
    const EdgeAdjacency adjacency = mesh.buildAdjacency();

    std::vector<bool> visited(mesh.getFaceCount(), false);
    std::queue<FaceIndex> frontier;
    frontier.push(seed);
    visited[seed] = true;

    while (!frontier.empty()) {
        FaceIndex current = frontier.front();
        frontier.pop();
        result.insert(current);

        for (const auto& [a, b] : mesh.getFaceEdges(current)) {
            auto it = adjacency.find(makeEdgeKey(a, b));
            if (it == adjacency.end()) continue;

            for (FaceIndex neighbor : it->second) {
                if (visited[neighbor]) continue;
                visited[neighbor] = true;
                if (glm::dot(mesh.getFaceNormal(neighbor), seedNormal) >= cosThreshold) {
                    frontier.push(neighbor);
                }
            }
        }
    }
    return result;
}

bool pointInPolygon(const glm::vec2& point, const std::vector<glm::vec2>& polygon) {
    bool inside = false;
    const size_t n = polygon.size();
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const glm::vec2& pi = polygon[i];
        const glm::vec2& pj = polygon[j];
        if ((pi.y > point.y) != (pj.y > point.y) &&
            point.x < (pj.x - pi.x) * (point.y - pi.y) / (pj.y - pi.y) + pi.x) {
            inside = !inside;
        }
    }
    return inside;
}

FaceSet freeformSelect(const EditMesh& mesh, const Transform& transform,
                       const std::vector<glm::vec2>& screenPolygon,
                       const Camera& camera, const Viewport& viewport) {
    FaceSet result;
    if (screenPolygon.size() < 3) return result;

    for (FaceIndex face = 0; face < mesh.getFaceCount(); ++face) {
        glm::vec3 worldCenter = transform.transformPoint(mesh.getFaceCenter(face));
        auto screen = camera.worldToScreen(worldCenter, viewport);
        if (!screen) continue;  // Behind the camera

        if (pointInPolygon(*screen, screenPolygon)) {
            result.insert(face);
        }
    }
    return result;
}

FaceSet select(const EditMesh& mesh, const Transform& transform, const SelectionRequest& request) {
    switch (request.type) {
        case GridType::WorldSpace:
            if (!mesh.isValidFace(request.face)) return {};
            return worldGridSelect(mesh, transform, request.worldCellSize, request.worldPoint);
        case GridType::SurfaceSpace:
            return surfaceFloodSelect(mesh, request.face, request.angleThreshold);
        case GridType::UVSpace:
            return uvGridSelect(mesh, request.face, request.uvCellSize);
        case GridType::Freeform:
            if (!request.camera) return {};
            return freeformSelect(mesh, transform, request.polygon, *request.camera, request.viewport);
    }
    return {};
}

} // namespace facet
