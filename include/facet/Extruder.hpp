#pragma once

#include "EditMesh.hpp"

#include <glm/glm.hpp>

namespace facet {

// Averaged placement of a face set, shared by the extruder and the drag controller
struct ExtrudeFrame {
    glm::vec3 centroid{0.0f};
    glm::vec3 normal{0.0f};    // Unit length, zero when the faces cancel out
    float totalArea = 0.0f;
};

// Area-weighted normal and centroid. Falls back to the plain centroid average
// when every face is degenerate.
ExtrudeFrame computeExtrudeFrame(const EditMesh& mesh, const FaceSet& faces);

// Extrusion direction: the frame normal tilted by angleDegrees about an axis
// perpendicular to it
glm::vec3 tiltedDirection(const glm::vec3& normal, float angleDegrees);

/**
 * @brief Offset a face set along its averaged normal and stitch side walls.
 *
 * Every vertex used by the selection is duplicated and moved, the selected
 * triangles are rewired onto the duplicates and each boundary edge of the
 * region gets a two-triangle wall. Unselected faces are carried over. A zero
 * distance is accepted and gives zero-thickness walls. Out-of-range indices
 * are ignored; an empty selection returns an unchanged copy.
 */
EditMesh extrudeFaces(const EditMesh& mesh, const FaceSet& faces, float distance, float angleDegrees = 0.0f);

} // namespace facet
