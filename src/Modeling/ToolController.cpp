#include <facet/ToolController.hpp>
#include <facet/Cutter.hpp>
#include <facet/ExtrudeDrag.hpp>
#include <facet/Extruder.hpp>
#include <facet/FacePicker.hpp>
#include <facet/RegionSelector.hpp>
#include <facet/SelectOps.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>

namespace facet {

ToolController::ToolController(IModelingHost& host, const ToolConfig& config)
    : m_host(host)
    , m_config(config)
    , m_state(ToolState::fromConfig(config))
{
}

bool ToolController::activate() {
    m_active = true;
    resetState();
    std::cout << "[ModelingTool] Activated" << std::endl;
    return syncTarget();
}

void ToolController::deactivate() {
    if (!m_active) return;
    m_active = false;
    m_session.end();
    resetState();
    m_targetName.clear();
    std::cout << "[ModelingTool] Deactivated" << std::endl;
}

void ToolController::resetState() {
    m_state = ToolState::fromConfig(m_config);
}

bool ToolController::syncTarget() {
    if (!m_active) return false;

    auto target = m_host.getSelectedTarget();
    if (!target) {
        if (m_session.isActive()) {
            std::cout << "[ModelingTool] No target selected, edit session closed" << std::endl;
            m_session.end();
            resetState();
        }
        return false;
    }

    // Same entity: keep the session, only follow its placement
    if (m_session.isActive() && m_session.getTarget() == target->id) {
        m_targetTransform = target->transform;
        return true;
    }

    m_session.end();
    resetState();

    if (!m_session.begin(target->id, target->mesh)) {
        std::cerr << "[ModelingTool] Cannot edit '" << target->name << "'" << std::endl;
        return false;
    }

    m_targetName = target->name;
    m_targetTransform = target->transform;
    std::cout << "[ModelingTool] Editing '" << m_targetName << "'" << std::endl;
    return true;
}

void ToolController::setOperation(ModelOperation op) {
    m_state.operation = op;
    m_state.clearDrag();
    if (op == ModelOperation::Extrude) {
        m_state.extrudeDistance = 0.0f;
    }
    std::cout << "[ModelingTool] Operation: " << operationToString(op) << std::endl;
}

void ToolController::cycleGridType() {
    m_state.gridType = facet::cycleGridType(m_state.gridType);
    m_state.clearFreeform();
    std::cout << "[ModelingTool] Grid: " << gridTypeToString(m_state.gridType) << std::endl;
}

void ToolController::toggleXray() {
    m_state.xray = !m_state.xray;
    std::cout << "[ModelingTool] X-ray selection: " << (m_state.xray ? "ON" : "OFF") << std::endl;
}

void ToolController::increaseGridSize() {
    switch (m_state.gridType) {
        case GridType::WorldSpace:
            m_state.worldGridSize = std::min(m_state.worldGridSize * 2.0f, m_config.maxWorldGridSize);
            std::cout << "[ModelingTool] World grid size: " << m_state.worldGridSize << std::endl;
            break;
        case GridType::UVSpace:
            m_state.uvGridSize = std::min(m_state.uvGridSize * 2.0f, m_config.maxUVGridSize);
            std::cout << "[ModelingTool] UV grid size: " << m_state.uvGridSize << std::endl;
            break;
        case GridType::SurfaceSpace:
            m_state.surfaceAngleThreshold = std::min(m_state.surfaceAngleThreshold + m_config.surfaceAngleStep,
                                                     m_config.maxSurfaceAngle);
            std::cout << "[ModelingTool] Surface angle: " << m_state.surfaceAngleThreshold << std::endl;
            break;
        case GridType::Freeform:
            break;
    }
}

void ToolController::decreaseGridSize() {
    switch (m_state.gridType) {
        case GridType::WorldSpace:
            m_state.worldGridSize = std::max(m_state.worldGridSize * 0.5f, m_config.minWorldGridSize);
            std::cout << "[ModelingTool] World grid size: " << m_state.worldGridSize << std::endl;
            break;
        case GridType::UVSpace:
            m_state.uvGridSize = std::max(m_state.uvGridSize * 0.5f, m_config.minUVGridSize);
            std::cout << "[ModelingTool] UV grid size: " << m_state.uvGridSize << std::endl;
            break;
        case GridType::SurfaceSpace:
            m_state.surfaceAngleThreshold = std::max(m_state.surfaceAngleThreshold - m_config.surfaceAngleStep,
                                                     m_config.minSurfaceAngle);
            std::cout << "[ModelingTool] Surface angle: " << m_state.surfaceAngleThreshold << std::endl;
            break;
        case GridType::Freeform:
            break;
    }
}

void ToolController::selectAll() {
    if (!m_session.isActive()) return;
    m_session.selectAll();
    std::cout << "[ModelingTool] Selected all " << m_session.getSelection().size() << " faces" << std::endl;
}

void ToolController::invertSelection() {
    if (!m_session.isActive()) return;
    m_session.invertSelection();
    std::cout << "[ModelingTool] Inverted selection: " << m_session.getSelection().size() << " faces" << std::endl;
}

void ToolController::clearSelection() {
    m_session.clearSelection();
}

void ToolController::growSelection() {
    if (!m_session.isActive()) return;
    applySelection(facet::growSelection(m_session.getMesh(), m_session.getSelection()), false);
}

void ToolController::shrinkSelection() {
    if (!m_session.isActive()) return;
    applySelection(facet::shrinkSelection(m_session.getMesh(), m_session.getSelection()), false);
}

void ToolController::selectLinked() {
    if (!m_session.isActive()) return;
    applySelection(facet::selectLinked(m_session.getMesh(), m_session.getSelection()), false);
}

void ToolController::selectByNormal() {
    if (!m_session.isActive()) return;
    applySelection(facet::selectByNormal(m_session.getMesh(), m_session.getSelection(),
                                         m_state.surfaceAngleThreshold), false);
}

void ToolController::applySelection(const FaceSet& faces, bool additive) {
    m_session.setSelection(faces, additive);
    std::cout << "[ModelingTool] Selected " << m_session.getSelection().size() << " faces" << std::endl;
}

bool ToolController::click(const Ray& worldRay, const Camera& camera, const Viewport& viewport, bool additive) {
    if (!m_session.isActive()) return false;

    // Clicks belong to the pending operation while one is active
    if (m_state.operation != ModelOperation::Select) return false;

    const EditMesh& mesh = m_session.getMesh();
    auto hit = pickFaceWorld(mesh, m_targetTransform, worldRay, m_state.xray);
    if (!hit) return false;

    glm::vec3 worldPoint = m_targetTransform.transformPoint(hit->point);

    if (m_state.gridType == GridType::Freeform) {
        if (m_state.drawingFreeform && m_state.freeformPoints.size() >= 3 &&
            glm::length(worldPoint - m_state.freeformPoints.front()) < m_config.freeformCloseRadius) {
            return closeFreeform(camera, viewport, additive);
        }
        if (!m_state.drawingFreeform) {
            m_state.freeformPoints.clear();
            m_state.drawingFreeform = true;
        }
        m_state.freeformPoints.push_back(worldPoint);
        return true;
    }

    SelectionRequest request;
    request.type = m_state.gridType;
    request.face = hit->face;
    request.worldPoint = worldPoint;
    request.worldCellSize = m_state.worldGridSize;
    request.uvCellSize = m_state.uvGridSize;
    request.angleThreshold = m_state.surfaceAngleThreshold;

    applySelection(select(mesh, m_targetTransform, request), additive);
    return true;
}

bool ToolController::closeFreeform(const Camera& camera, const Viewport& viewport, bool additive) {
    if (!m_session.isActive() || !m_state.drawingFreeform) return false;

    if (m_state.freeformPoints.size() < 3) {
        std::cout << "[ModelingTool] Freeform needs at least 3 points" << std::endl;
        return false;
    }

    SelectionRequest request;
    request.type = GridType::Freeform;
    request.camera = &camera;
    request.viewport = viewport;
    // Dropping a point would reshape the lasso, so the close waits for a better view
    for (const glm::vec3& p : m_state.freeformPoints) {
        auto screen = camera.worldToScreen(p, viewport);
        if (!screen) {
            std::cout << "[ModelingTool] Freeform point is behind the camera, lasso kept open" << std::endl;
            return false;
        }
        request.polygon.push_back(*screen);
    }

    FaceSet faces = select(m_session.getMesh(), m_targetTransform, request);
    m_state.clearFreeform();
    applySelection(faces, additive);
    return true;
}

EscapeResult ToolController::escape() {
    if (m_state.drawingFreeform) {
        m_state.clearFreeform();
        if (m_state.operation != ModelOperation::Select) {
            m_state.operation = ModelOperation::Select;
            m_state.extrudeDistance = 0.0f;
            m_state.clearDrag();
        }
        std::cout << "[ModelingTool] Freeform cancelled" << std::endl;
        return EscapeResult::CancelledFreeform;
    }

    if (m_state.operation != ModelOperation::Select) {
        m_state.operation = ModelOperation::Select;
        m_state.extrudeDistance = 0.0f;
        m_state.clearDrag();
        std::cout << "[ModelingTool] Operation: Select" << std::endl;
        return EscapeResult::ReturnedToSelect;
    }

    deactivate();
    return EscapeResult::ExitedTool;
}

bool ToolController::updateDrag(bool buttonHeld, const Ray& worldRay) {
    if (!m_session.isActive()) return false;
    return updateExtrudeDrag(m_state, m_session.getMesh(), m_session.getSelection(),
                             m_targetTransform, buttonHeld, worldRay);
}

void ToolController::commit(EditMesh mesh) {
    m_host.applyEditedMesh(m_session.getTarget(), mesh.toRenderable(), mesh.toCollisionShape());
    m_session.replaceMesh(std::move(mesh));
    m_state.operation = ModelOperation::Select;
    m_state.extrudeDistance = 0.0f;
    m_state.clearDrag();
}

ConfirmResult ToolController::confirm() {
    if (!m_session.isActive()) {
        return ConfirmResult::reject("No mesh is being edited");
    }

    switch (m_state.operation) {
        case ModelOperation::Extrude:
            return confirmExtrude();
        case ModelOperation::Cut:
            return confirmCut();
        case ModelOperation::Select:
            break;
    }
    return ConfirmResult::reject("Nothing to confirm in Select");
}

ConfirmResult ToolController::confirmExtrude() {
    if (!m_session.hasSelection()) {
        return ConfirmResult::reject("Extrude needs a face selection");
    }
    if (std::abs(m_state.extrudeDistance) < m_config.minExtrudeDistance) {
        return ConfirmResult::reject("Extrude distance is zero");
    }

    m_host.captureUndoSnapshot("Extrude faces");

    size_t faceCount = m_session.getSelection().size();
    commit(extrudeFaces(m_session.getMesh(), m_session.getSelection(),
                        m_state.extrudeDistance, m_state.extrudeAngle));

    std::cout << "[ModelingTool] Extruded " << faceCount << " faces, mesh now has "
              << m_session.getMesh().getFaceCount() << " faces" << std::endl;
    return ConfirmResult::accept("Extrusion applied");
}

ConfirmResult ToolController::confirmCut() {
    if (!m_session.hasSelection()) {
        return ConfirmResult::reject("Cut needs a face selection");
    }

    CutResult cut = cutFaces(m_session.getMesh(), m_session.getSelection());
    if (!cut.isValid()) {
        std::cout << "[ModelingTool] Cut produced empty geometry, skipping" << std::endl;
        return ConfirmResult::reject("Cut would leave an empty mesh");
    }

    m_host.captureUndoSnapshot("Cut mesh");

    std::string cutName = (m_targetName.empty() ? std::string("Mesh") : m_targetName) + " (cut)";
    m_host.spawnCutMesh(m_session.getTarget(), cutName,
                        cut.cutOut.toRenderable(), cut.cutOut.toCollisionShape());

    size_t cutFaceCount = cut.cutOut.getFaceCount();
    commit(std::move(cut.remaining));

    std::cout << "[ModelingTool] Cut " << cutFaceCount << " faces into '" << cutName << "'" << std::endl;
    return ConfirmResult::accept("Cut applied");
}

ConfirmResult ToolController::deleteSelected() {
    if (!m_session.isActive() || !m_session.hasSelection()) {
        return ConfirmResult::reject("Delete needs a face selection");
    }

    m_host.captureUndoSnapshot("Delete faces");

    size_t faceCount = m_session.getSelection().size();
    commit(deleteFaces(m_session.getMesh(), m_session.getSelection()));

    std::cout << "[ModelingTool] Deleted " << faceCount << " faces" << std::endl;
    return ConfirmResult::accept("Faces deleted");
}

} // namespace facet
