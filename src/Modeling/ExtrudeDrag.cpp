#include <facet/ExtrudeDrag.hpp>
#include <facet/Extruder.hpp>
#include <cmath>

namespace facet {

std::optional<float> closestAxisParameter(const glm::vec3& axisOrigin, const glm::vec3& axisDir,
                                          const Ray& ray) {
    // Closest points between axisOrigin + s*axisDir and ray.origin + t*ray.direction
    glm::vec3 w0 = axisOrigin - ray.origin;

    float a = glm::dot(axisDir, axisDir);
    float b = glm::dot(axisDir, ray.direction);
    float c = glm::dot(ray.direction, ray.direction);
    float d = glm::dot(axisDir, w0);
    float e = glm::dot(ray.direction, w0);

    float denom = a * c - b * b;
    if (std::abs(denom) < 0.0001f * a * c || a * c <= 0.0f) {
        return std::nullopt;  // Lines are parallel
    }

    return (b * e - c * d) / denom;
}

bool updateExtrudeDrag(ToolState& state, const EditMesh& mesh, const FaceSet& selection,
                       const Transform& transform, bool buttonHeld, const Ray& viewRay) {
    if (!buttonHeld || state.operation != ModelOperation::Extrude || selection.empty()) {
        state.clearDrag();
        return false;
    }

    if (!state.isDragging()) {
        ExtrudeFrame frame = computeExtrudeFrame(mesh, selection);
        if (glm::dot(frame.normal, frame.normal) < 1e-12f) return false;

        // Unnormalized world axis so s stays in the mesh's local units
        glm::vec3 origin = transform.transformPoint(frame.centroid);
        glm::vec3 axis = transform.transformDirection(frame.normal);

        auto s = closestAxisParameter(origin, axis, viewRay);
        if (!s) return false;

        state.dragOrigin = origin;
        state.dragNormal = axis;
        state.dragBaseline = *s;

        bool changed = state.extrudeDistance != 0.0f;
        state.extrudeDistance = 0.0f;
        return changed;
    }

    auto s = closestAxisParameter(*state.dragOrigin, *state.dragNormal, viewRay);
    if (!s) return false;

    float distance = *s - *state.dragBaseline;
    if (distance == state.extrudeDistance) return false;
    state.extrudeDistance = distance;
    return true;
}

} // namespace facet
