#pragma once

#include "EditMesh.hpp"
#include "Geometry.hpp"
#include "ToolState.hpp"
#include "Transform.hpp"

#include <glm/glm.hpp>
#include <optional>

namespace facet {

/**
 * @brief Parameter s of the point on the line axisOrigin + s * axisDir closest
 * to the view ray's line.
 *
 * Returns none when the lines are (nearly) parallel.
 */
std::optional<float> closestAxisParameter(const glm::vec3& axisOrigin, const glm::vec3& axisDir,
                                          const Ray& ray);

/**
 * @brief Advance the extrude drag by one frame.
 *
 * The first held frame captures the selection centroid and averaged normal in
 * world space and resets the distance. Later frames set the distance to how far
 * the cursor ray's closest point has moved along that axis. A parallel frame
 * leaves the distance alone; releasing the button clears the anchors.
 *
 * @return true when extrudeDistance changed
 */
bool updateExtrudeDrag(ToolState& state, const EditMesh& mesh, const FaceSet& selection,
                       const Transform& transform, bool buttonHeld, const Ray& viewRay);

} // namespace facet
