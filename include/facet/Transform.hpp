#pragma once

#include "Geometry.hpp"

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>

namespace facet {

// Placement of a mesh entity in the world. Meshes are edited in local space,
// everything the user points at arrives in world space.
class Transform {
public:
    Transform() = default;

    void setPosition(const glm::vec3& pos) { m_position = pos; m_dirty = true; }

    void setRotation(const glm::vec3& eulerDegrees) {
        m_rotation = glm::quat(glm::radians(eulerDegrees));
        m_dirty = true;
    }
    void setRotation(float degrees, const glm::vec3& axis) {
        m_rotation = glm::angleAxis(glm::radians(degrees), glm::normalize(axis));
        m_dirty = true;
    }
    void setRotation(const glm::quat& quat) {
        m_rotation = quat;
        m_dirty = true;
    }

    void setScale(const glm::vec3& scale) { m_scale = scale; m_dirty = true; }
    void setScale(float uniform) { setScale({uniform, uniform, uniform}); }

    const glm::vec3& getPosition() const { return m_position; }
    const glm::quat& getRotation() const { return m_rotation; }
    const glm::vec3& getScale() const { return m_scale; }

    const glm::mat4& getMatrix() const {
        if (m_dirty) rebuild();
        return m_matrix;
    }

    const glm::mat4& getInverseMatrix() const {
        if (m_dirty) rebuild();
        return m_inverse;
    }

    glm::vec3 transformPoint(const glm::vec3& local) const {
        return glm::vec3(getMatrix() * glm::vec4(local, 1.0f));
    }

    // No normalization: scale is carried into the result
    glm::vec3 transformDirection(const glm::vec3& local) const {
        return glm::vec3(getMatrix() * glm::vec4(local, 0.0f));
    }

    // Direction is left unnormalized so t values match between both spaces
    Ray worldToLocal(const Ray& world) const {
        const glm::mat4& inv = getInverseMatrix();
        Ray local;
        local.origin = glm::vec3(inv * glm::vec4(world.origin, 1.0f));
        local.direction = glm::vec3(inv * glm::vec4(world.direction, 0.0f));
        return local;
    }

private:
    void rebuild() const {
        m_matrix = glm::translate(glm::mat4(1.0f), m_position)
                 * glm::mat4_cast(m_rotation)
                 * glm::scale(glm::mat4(1.0f), m_scale);
        m_inverse = glm::inverse(m_matrix);
        m_dirty = false;
    }

    glm::vec3 m_position{0.0f};
    glm::quat m_rotation{1.0f, 0.0f, 0.0f, 0.0f};
    glm::vec3 m_scale{1.0f};
    mutable glm::mat4 m_matrix{1.0f};
    mutable glm::mat4 m_inverse{1.0f};
    mutable bool m_dirty = true;
};

} // namespace facet
