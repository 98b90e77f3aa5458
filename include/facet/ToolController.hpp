#pragma once

#include "Camera.hpp"
#include "EditSession.hpp"
#include "Geometry.hpp"
#include "IModelingHost.hpp"
#include "ToolConfig.hpp"
#include "ToolState.hpp"
#include "Transform.hpp"

#include <glm/glm.hpp>
#include <string>
#include <utility>
#include <vector>

namespace facet {

struct ConfirmResult {
    enum class Status {
        Applied,
        Rejected
    };

    Status status = Status::Rejected;
    std::string message;

    bool applied() const { return status == Status::Applied; }

    static ConfirmResult accept(std::string msg) { return {Status::Applied, std::move(msg)}; }
    static ConfirmResult reject(std::string msg) { return {Status::Rejected, std::move(msg)}; }
};

// What a single Escape press did
enum class EscapeResult {
    CancelledFreeform,
    ReturnedToSelect,
    ExitedTool
};

/**
 * @brief Face modeling tool: turns user intents into selections and edits
 *
 * Owns the ToolState and the EditSession for the host's selected entity.
 * Every intent is one synchronous call.
 */
class ToolController {
public:
    explicit ToolController(IModelingHost& host, const ToolConfig& config = ToolConfig());

    // Lifecycle
    bool activate();
    void deactivate();
    bool isActive() const { return m_active; }

    /**
     * @brief Follow the host's selected entity
     *
     * A different entity (or none) discards the session and resets the state.
     * @return true when a session is running on the current target
     */
    bool syncTarget();

    // Mode and parameters
    void setOperation(ModelOperation op);
    void cycleGridType();
    void toggleXray();
    void increaseGridSize();
    void decreaseGridSize();
    void setExtrudeDistance(float distance) { m_state.extrudeDistance = distance; }
    void setExtrudeAngle(float degrees) { m_state.extrudeAngle = degrees; }

    // Selection intents
    void selectAll();
    void invertSelection();
    void clearSelection();
    void growSelection();
    void shrinkSelection();
    void selectLinked();
    void selectByNormal();

    /**
     * @brief Left click under the cursor
     * @param worldRay Camera ray through the cursor
     * @param additive Modifier held: merge with the current selection
     * @return true when the selection or the lasso changed
     */
    bool click(const Ray& worldRay, const Camera& camera, const Viewport& viewport, bool additive);

    // Close the lasso in progress and select what it encloses
    bool closeFreeform(const Camera& camera, const Viewport& viewport, bool additive);

    EscapeResult escape();

    /**
     * @brief Extrude drag, once per frame
     * @param buttonHeld Primary button state this frame
     * @param worldRay Camera ray through the cursor
     */
    bool updateDrag(bool buttonHeld, const Ray& worldRay);

    ConfirmResult confirm();
    ConfirmResult deleteSelected();

    const ToolState& getState() const { return m_state; }
    const ToolConfig& getConfig() const { return m_config; }
    const EditSession& getSession() const { return m_session; }
    const FaceSet& getSelection() const { return m_session.getSelection(); }
    const Transform& getTargetTransform() const { return m_targetTransform; }

    // Lasso points for preview rendering
    const std::vector<glm::vec3>& getFreeformPoints() const { return m_state.freeformPoints; }

private:
    void resetState();
    void applySelection(const FaceSet& faces, bool additive);
    void commit(EditMesh mesh);

    ConfirmResult confirmExtrude();
    ConfirmResult confirmCut();

    IModelingHost& m_host;
    ToolConfig m_config;
    ToolState m_state;
    EditSession m_session;

    std::string m_targetName;
    Transform m_targetTransform;
    bool m_active = false;
};

} // namespace facet
