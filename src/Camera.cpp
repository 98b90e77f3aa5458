#include <facet/Camera.hpp>
#include <algorithm>
#include <cmath>

namespace facet {

Camera::Camera(const glm::vec3& position)
    : m_position(position)
{
    updateVectors();
}

void Camera::lookAt(const glm::vec3& target) {
    glm::vec3 dir = target - m_position;
    if (glm::dot(dir, dir) < 1e-12f) return;
    dir = glm::normalize(dir);

    m_pitch = std::clamp(glm::degrees(std::asin(dir.y)), -89.9f, 89.9f);
    m_yaw = glm::degrees(std::atan2(dir.z, dir.x));
    m_viewPreset = ViewPreset::Custom;
    updateVectors();
}

void Camera::updateVectors() {
    glm::vec3 front;
    front.x = cos(glm::radians(m_yaw)) * cos(glm::radians(m_pitch));
    front.y = sin(glm::radians(m_pitch));
    front.z = sin(glm::radians(m_yaw)) * cos(glm::radians(m_pitch));

    m_front = glm::normalize(front);
    m_right = glm::normalize(glm::cross(m_front, m_worldUp));
    m_up = glm::normalize(glm::cross(m_right, m_front));
}

glm::mat4 Camera::getViewMatrix() const {
    return glm::lookAt(m_position, m_position + m_front, m_up);
}

glm::mat4 Camera::getProjectionMatrix(float aspectRatio) const {
    if (m_projectionMode == ProjectionMode::Orthographic) {
        float halfHeight = m_orthoSize;
        float halfWidth = halfHeight * aspectRatio;
        // Right-handed, depth [0,1]
        return glm::orthoRH_ZO(-halfWidth, halfWidth, -halfHeight, halfHeight, m_near, m_far);
    }
    return glm::perspectiveRH_ZO(glm::radians(m_fov), aspectRatio, m_near, m_far);
}

void Camera::setViewPreset(ViewPreset preset, const glm::vec3& targetCenter) {
    m_viewPreset = preset;

    float viewDistance = m_orthoSize * 2.0f + 10.0f;

    switch (preset) {
        case ViewPreset::Top:
            m_position = targetCenter + glm::vec3(0, viewDistance, 0);
            m_yaw = -90.0f;
            m_pitch = -89.9f;  // Looking straight down
            m_projectionMode = ProjectionMode::Orthographic;
            break;

        case ViewPreset::Front:
            m_position = targetCenter + glm::vec3(0, 0, viewDistance);
            m_yaw = -90.0f;
            m_pitch = 0.0f;
            m_projectionMode = ProjectionMode::Orthographic;
            break;

        case ViewPreset::Right:
            m_position = targetCenter + glm::vec3(viewDistance, 0, 0);
            m_yaw = 180.0f;
            m_pitch = 0.0f;
            m_projectionMode = ProjectionMode::Orthographic;
            break;

        case ViewPreset::Custom:
            m_projectionMode = ProjectionMode::Perspective;
            break;
    }

    updateVectors();
}

Ray Camera::screenToWorldRay(const glm::vec2& pixel, const Viewport& viewport) const {
    // Pixel to NDC, y flipped so +1 is the top of the view
    float ndcX = (pixel.x / viewport.width) * 2.0f - 1.0f;
    float ndcY = 1.0f - (pixel.y / viewport.height) * 2.0f;

    glm::mat4 invViewProj = glm::inverse(getProjectionMatrix(viewport.aspect()) * getViewMatrix());

    glm::vec4 nearPoint = invViewProj * glm::vec4(ndcX, ndcY, 0.0f, 1.0f);
    glm::vec4 farPoint = invViewProj * glm::vec4(ndcX, ndcY, 1.0f, 1.0f);
    nearPoint /= nearPoint.w;
    farPoint /= farPoint.w;

    Ray ray;
    if (m_projectionMode == ProjectionMode::Orthographic) {
        ray.origin = glm::vec3(nearPoint);
        ray.direction = m_front;
    } else {
        ray.origin = m_position;
        ray.direction = glm::normalize(glm::vec3(farPoint) - glm::vec3(nearPoint));
    }
    return ray;
}

std::optional<glm::vec2> Camera::worldToScreen(const glm::vec3& point, const Viewport& viewport) const {
    glm::vec4 viewPos = getViewMatrix() * glm::vec4(point, 1.0f);
    // Camera looks down -Z in view space
    if (-viewPos.z <= 1e-6f) {
        return std::nullopt;
    }

    glm::vec4 clip = getProjectionMatrix(viewport.aspect()) * viewPos;
    if (clip.w <= 1e-6f) {
        return std::nullopt;
    }

    glm::vec3 ndc = glm::vec3(clip) / clip.w;
    return glm::vec2((ndc.x + 1.0f) * 0.5f * viewport.width,
                     (1.0f - ndc.y) * 0.5f * viewport.height);
}

} // namespace facet
