#pragma once

#include "RegionSelector.hpp"
#include "ToolConfig.hpp"

#include <glm/glm.hpp>
#include <optional>
#include <vector>

namespace facet {

// Operation applied when the user confirms
enum class ModelOperation {
    Select,
    Extrude,
    Cut
};

const char* operationToString(ModelOperation op);

// Everything the modeling tool remembers between steps. Owned by the
// ToolController and reset when the target changes.
struct ToolState {
    ModelOperation operation = ModelOperation::Select;
    GridType gridType = GridType::WorldSpace;

    float worldGridSize = 0.5f;
    float uvGridSize = 0.1f;
    float surfaceAngleThreshold = 30.0f;   // Degrees
    float extrudeDistance = 0.0f;
    float extrudeAngle = 0.0f;             // Tilt, degrees
    bool xray = false;

    // Lasso in progress, as clicked world points
    std::vector<glm::vec3> freeformPoints;
    bool drawingFreeform = false;

    // Extrude drag anchors, world space, valid while the button is held
    std::optional<glm::vec3> dragOrigin;
    std::optional<glm::vec3> dragNormal;
    std::optional<float> dragBaseline;

    static ToolState fromConfig(const ToolConfig& config);

    bool isDragging() const { return dragOrigin.has_value(); }

    void clearDrag() {
        dragOrigin.reset();
        dragNormal.reset();
        dragBaseline.reset();
    }

    void clearFreeform() {
        freeformPoints.clear();
        drawingFreeform = false;
    }
};

} // namespace facet
