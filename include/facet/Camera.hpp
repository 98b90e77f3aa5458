#pragma once

#include "Geometry.hpp"

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <optional>

namespace facet {

enum class ProjectionMode {
    Perspective,
    Orthographic
};

enum class ViewPreset {
    Custom,     // Free camera
    Top,        // Looking down -Y
    Front,      // Looking down -Z
    Right       // Looking down -X
};

// Editor viewpoint. Supplies the view ray under the cursor and projects
// world points back to pixels for lasso selection.
class Camera {
public:
    Camera(const glm::vec3& position = {0, 0, 5});

    void setPosition(const glm::vec3& pos) { m_position = pos; }
    void setFov(float fov) { m_fov = fov; }
    void setYaw(float yaw) { m_yaw = yaw; updateVectors(); }
    void setPitch(float pitch) { m_pitch = pitch; updateVectors(); }
    void setClipPlanes(float nearPlane, float farPlane) { m_near = nearPlane; m_far = farPlane; }

    // Aim at a point from the current position
    void lookAt(const glm::vec3& target);

    const glm::vec3& getPosition() const { return m_position; }
    const glm::vec3& getFront() const { return m_front; }
    glm::vec3 getRight() const { return m_right; }
    glm::vec3 getUp() const { return m_up; }
    float getYaw() const { return m_yaw; }
    float getPitch() const { return m_pitch; }
    float getFov() const { return m_fov; }

    void setProjectionMode(ProjectionMode mode) { m_projectionMode = mode; }
    ProjectionMode getProjectionMode() const { return m_projectionMode; }
    void setOrthoSize(float size) { m_orthoSize = size; }  // Half-height of ortho view
    float getOrthoSize() const { return m_orthoSize; }

    void setViewPreset(ViewPreset preset, const glm::vec3& targetCenter = glm::vec3(0));
    ViewPreset getViewPreset() const { return m_viewPreset; }

    glm::mat4 getViewMatrix() const;
    glm::mat4 getProjectionMatrix(float aspectRatio) const;

    // Ray from the camera through a pixel (origin top-left)
    Ray screenToWorldRay(const glm::vec2& pixel, const Viewport& viewport) const;

    // Pixel position of a world point, none when it is at or behind the camera
    std::optional<glm::vec2> worldToScreen(const glm::vec3& point, const Viewport& viewport) const;

private:
    void updateVectors();

    glm::vec3 m_position;
    glm::vec3 m_front{0, 0, -1};
    glm::vec3 m_up{0, 1, 0};
    glm::vec3 m_right{1, 0, 0};
    glm::vec3 m_worldUp{0, 1, 0};

    float m_yaw = -90.0f;   // Looking along -Z
    float m_pitch = 0.0f;
    float m_fov = 60.0f;
    float m_near = 0.1f;
    float m_far = 1000.0f;

    ProjectionMode m_projectionMode = ProjectionMode::Perspective;
    float m_orthoSize = 5.0f;
    ViewPreset m_viewPreset = ViewPreset::Custom;
};

} // namespace facet
