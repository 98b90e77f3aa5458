#pragma once

#include "EditMesh.hpp"
#include "RenderableMesh.hpp"

#include <cstdint>

namespace facet {

using EntityId = uint64_t;
constexpr EntityId kInvalidEntity = UINT64_MAX;

// One target entity's mesh together with the faces selected on it. The
// selection can only be changed through this class and is cleared whenever
// the mesh is replaced, so it never refers to another mesh generation.
class EditSession {
public:
    EditSession() = default;

    // Load a target's mesh; fails without side effects on invalid input
    bool begin(EntityId target, const RenderableMesh& mesh);
    void end();

    bool isActive() const { return m_target != kInvalidEntity; }
    EntityId getTarget() const { return m_target; }
    uint64_t getGeneration() const { return m_generation; }

    const EditMesh& getMesh() const { return m_mesh; }

    // Swap in the result of a structural edit
    void replaceMesh(EditMesh mesh);

    const FaceSet& getSelection() const { return m_selection; }
    bool hasSelection() const { return !m_selection.empty(); }

    // Indices past the face count are dropped
    void setSelection(const FaceSet& faces, bool additive = false);
    void selectAll();
    void invertSelection();
    void clearSelection() { m_selection.clear(); }

private:
    EntityId m_target = kInvalidEntity;
    EditMesh m_mesh;
    FaceSet m_selection;
    uint64_t m_generation = 0;
};

} // namespace facet
