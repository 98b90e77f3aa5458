#pragma once

#include "Camera.hpp"
#include "EditMesh.hpp"
#include "Geometry.hpp"
#include "Transform.hpp"

#include <glm/glm.hpp>
#include <vector>

namespace facet {

// How a clicked face grows into a region
enum class GridType {
    WorldSpace,     // Faces whose world centroid shares the clicked cell
    SurfaceSpace,   // Flood fill across edges within an angle of the clicked face
    UVSpace,        // Faces whose UV centroid shares the clicked face's UV cell
    Freeform        // Screen-space lasso
};

// World -> Surface -> UV -> Freeform -> World
GridType cycleGridType(GridType type);
const char* gridTypeToString(GridType type);

FaceSet worldGridSelect(const EditMesh& mesh, const Transform& transform,
                        float cellSize, const glm::vec3& worldPoint);

FaceSet uvGridSelect(const EditMesh& mesh, FaceIndex clickedFace, float uvCellSize);

// Breadth-first over shared edges; neighbours are compared against the seed normal
FaceSet surfaceFloodSelect(const EditMesh& mesh, FaceIndex seed, float angleThresholdDegrees);

// Faces whose projected world centroid is inside the screen polygon (even-odd rule)
FaceSet freeformSelect(const EditMesh& mesh, const Transform& transform,
                       const std::vector<glm::vec2>& screenPolygon,
                       const Camera& camera, const Viewport& viewport);

bool pointInPolygon(const glm::vec2& point, const std::vector<glm::vec2>& polygon);

struct SelectionRequest {
    GridType type = GridType::WorldSpace;

    // Picked face and hit point, used by the grid and surface modes
    FaceIndex face = UINT32_MAX;
    glm::vec3 worldPoint{0.0f};

    float worldCellSize = 0.5f;
    float uvCellSize = 0.1f;
    float angleThreshold = 30.0f;

    // Freeform only
    std::vector<glm::vec2> polygon;
    const Camera* camera = nullptr;
    Viewport viewport;
};

/**
 * @brief Expand a request into a fresh face set using the requested mode.
 *
 * Merging with an existing selection is left to the caller.
 */
FaceSet select(const EditMesh& mesh, const Transform& transform, const SelectionRequest& request);

} // namespace facet
