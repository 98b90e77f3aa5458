#include <facet/EditSession.hpp>
#include <iostream>
#include <utility>

namespace facet {

bool EditSession::begin(EntityId target, const RenderableMesh& mesh) {
    auto editMesh = EditMesh::fromRenderable(mesh);
    if (!editMesh) {
        std::cerr << "[EditSession] Target " << target << " has no editable triangle mesh" << std::endl;
        return false;
    }

    m_target = target;
    m_mesh = std::move(*editMesh);
    m_selection.clear();
    m_generation++;

    std::cout << "[EditSession] Editing target " << target << ": "
              << m_mesh.getVertexCount() << " vertices, "
              << m_mesh.getFaceCount() << " faces" << std::endl;
    return true;
}

void EditSession::end() {
    m_target = kInvalidEntity;
    m_mesh = EditMesh();
    m_selection.clear();
    m_generation++;
}

void EditSession::replaceMesh(EditMesh mesh) {
    m_mesh = std::move(mesh);
    m_selection.clear();
    m_generation++;
}

void EditSession::setSelection(const FaceSet& faces, bool additive) {
    if (!additive) {
        m_selection.clear();
    }
    for (FaceIndex face : faces) {
        if (m_mesh.isValidFace(face)) {
            m_selection.insert(face);
        }
    }
}

void EditSession::selectAll() {
    m_selection.clear();
    for (FaceIndex face = 0; face < m_mesh.getFaceCount(); ++face) {
        m_selection.insert(face);
    }
}

void EditSession::invertSelection() {
    FaceSet inverted;
    for (FaceIndex face = 0; face < m_mesh.getFaceCount(); ++face) {
        if (!m_selection.count(face)) {
            inverted.insert(face);
        }
    }
    m_selection = std::move(inverted);
}

} // namespace facet
