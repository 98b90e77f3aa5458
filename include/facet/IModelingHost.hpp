#pragma once

#include "EditSession.hpp"
#include "RenderableMesh.hpp"
#include "Transform.hpp"

#include <optional>
#include <string>

namespace facet {

// Entity the host editor currently has selected
struct HostTarget {
    EntityId id = kInvalidEntity;
    std::string name;
    RenderableMesh mesh;
    Transform transform;
};

/**
 * @brief Interface the host editor implements for the modeling tool
 *
 * The tool never owns entities. It reads the selected entity from the host and
 * hands finished edits back through these calls.
 */
class IModelingHost {
public:
    virtual ~IModelingHost() = default;

    /**
     * @brief Entity selected in the host, if any
     */
    virtual std::optional<HostTarget> getSelectedTarget() const = 0;

    /**
     * @brief Record an undo point before a committing edit
     * @param description Short label for the undo history
     */
    virtual void captureUndoSnapshot(const std::string& description) = 0;

    /**
     * @brief Replace an entity's mesh and collider with edited data
     */
    virtual void applyEditedMesh(EntityId target, const RenderableMesh& mesh,
                                 const CollisionShape& collider) = 0;

    /**
     * @brief Create a new entity from faces cut off another one
     * @param source Entity the faces came from (its transform is reused)
     * @param name Display name for the new entity
     */
    virtual void spawnCutMesh(EntityId source, const std::string& name,
                              const RenderableMesh& mesh, const CollisionShape& collider) = 0;

protected:
    IModelingHost() = default;
};

} // namespace facet
