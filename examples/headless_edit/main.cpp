/**
 * @file main.cpp
 * @brief Headless face modeling session
 *
 * Drives the modeling tool against a small in-memory scene:
 * - Selects the top of a crate with a surface click and extrudes it
 * - Cuts a side panel off into its own entity
 * Pass a tool config JSON as the first argument to override the defaults.
 */

#include <facet/Facet.hpp>

#include <iostream>
#include <map>
#include <string>

using namespace facet;

// Crate standing on the ground, one quad per side so each side is its own UV island
static RenderableMesh createCrate(float size) {
    RenderableMesh mesh;
    float h = size / 2.0f;

    glm::vec3 corners[8] = {
        {-h, 0, -h}, { h, 0, -h}, { h, size, -h}, {-h, size, -h},
        {-h, 0,  h}, { h, 0,  h}, { h, size,  h}, {-h, size,  h}
    };

    auto addQuad = [&](int c0, int c1, int c2, int c3, glm::vec3 normal) {
        uint32_t base = mesh.getVertexCount();
        const int quad[4] = {c0, c1, c2, c3};
        const glm::vec2 uvs[4] = {{0, 0}, {1, 0}, {1, 1}, {0, 1}};
        for (int i = 0; i < 4; ++i) {
            mesh.positions.push_back(corners[quad[i]]);
            mesh.normals.push_back(normal);
            mesh.uvs.push_back(uvs[i]);
        }
        mesh.indices.insert(mesh.indices.end(), {base + 0, base + 1, base + 2, base + 0, base + 2, base + 3});
    };

    addQuad(4, 5, 6, 7, {0, 0, 1});    // Front (+Z)
    addQuad(1, 0, 3, 2, {0, 0, -1});   // Back (-Z)
    addQuad(0, 4, 7, 3, {-1, 0, 0});   // Left (-X)
    addQuad(5, 1, 2, 6, {1, 0, 0});    // Right (+X)
    addQuad(7, 6, 2, 3, {0, 1, 0});    // Top (+Y)
    addQuad(0, 1, 5, 4, {0, -1, 0});   // Bottom (-Y)

    return mesh;
}

// Minimal scene standing in for the editor: named entities with a mesh and collider
class SceneHost : public IModelingHost {
public:
    struct Entity {
        std::string name;
        RenderableMesh mesh;
        CollisionShape collider;
        Transform transform;
    };

    EntityId addEntity(const std::string& name, const RenderableMesh& mesh, const Transform& transform) {
        EntityId id = m_nextId++;
        m_entities[id] = {name, mesh, {}, transform};
        return id;
    }

    void setSelected(EntityId id) { m_selected = id; }

    std::optional<HostTarget> getSelectedTarget() const override {
        auto it = m_entities.find(m_selected);
        if (it == m_entities.end()) return std::nullopt;

        HostTarget target;
        target.id = it->first;
        target.name = it->second.name;
        target.mesh = it->second.mesh;
        target.transform = it->second.transform;
        return target;
    }

    void captureUndoSnapshot(const std::string& description) override {
        m_undoStack.push_back(description);
        std::cout << "[Scene] Undo point: " << description << std::endl;
    }

    void applyEditedMesh(EntityId target, const RenderableMesh& mesh, const CollisionShape& collider) override {
        auto it = m_entities.find(target);
        if (it == m_entities.end()) {
            std::cerr << "[Scene] Edit for unknown entity " << target << std::endl;
            return;
        }
        it->second.mesh = mesh;
        it->second.collider = collider;
    }

    void spawnCutMesh(EntityId source, const std::string& name,
                      const RenderableMesh& mesh, const CollisionShape& collider) override {
        Transform transform;
        auto it = m_entities.find(source);
        if (it != m_entities.end()) {
            transform = it->second.transform;
        }
        EntityId id = addEntity(name, mesh, transform);
        m_entities[id].collider = collider;
    }

    void printSummary() const {
        std::cout << "[Scene] " << m_entities.size() << " entities, "
                  << m_undoStack.size() << " undo points" << std::endl;
        for (const auto& [id, entity] : m_entities) {
            std::cout << "  - " << id << " '" << entity.name << "': "
                      << entity.mesh.indices.size() / 3 << " triangles, collider "
                      << entity.collider.triangles.size() << " triangles" << std::endl;
        }
    }

private:
    std::map<EntityId, Entity> m_entities;
    std::vector<std::string> m_undoStack;
    EntityId m_nextId = 1;
    EntityId m_selected = kInvalidEntity;
};

static void report(const char* step, const ConfirmResult& result) {
    std::cout << "[HeadlessEdit] " << step << ": "
              << (result.applied() ? "applied" : "rejected") << " (" << result.message << ")" << std::endl;
}

int main(int argc, char* argv[]) {
    ToolConfig config;
    if (argc > 1) {
        if (!ToolConfigSerializer::load(argv[1], config)) {
            std::cerr << "[HeadlessEdit] " << ToolConfigSerializer::getLastError() << std::endl;
            return 1;
        }
    }

    SceneHost scene;
    Transform crateTransform;
    crateTransform.setPosition({0.0f, 0.0f, -4.0f});
    EntityId crate = scene.addEntity("Crate", createCrate(1.0f), crateTransform);
    scene.setSelected(crate);

    Camera camera({0.0f, 2.5f, 0.0f});
    camera.lookAt({0.0f, 0.5f, -4.0f});
    Viewport viewport{1280.0f, 720.0f};

    ToolController tool(scene, config);
    if (!tool.activate()) {
        std::cerr << "[HeadlessEdit] Nothing to edit" << std::endl;
        return 1;
    }

    // Surface click on the lid selects the whole top
    tool.cycleGridType();
    auto lid = camera.worldToScreen({0.1f, 1.0f, -4.1f}, viewport);
    if (!lid || !tool.click(camera.screenToWorldRay(*lid, viewport), camera, viewport, false)) {
        std::cerr << "[HeadlessEdit] Lid is not under the cursor" << std::endl;
        return 1;
    }

    // Pull the lid up by dragging along its normal
    tool.setOperation(ModelOperation::Extrude);
    tool.updateDrag(true, Ray{{3.0f, 1.0f, -4.0f}, {-1.0f, 0.0f, 0.0f}});
    tool.updateDrag(true, Ray{{3.0f, 1.5f, -4.0f}, {-1.0f, 0.0f, 0.0f}});
    tool.updateDrag(false, Ray{{3.0f, 1.5f, -4.0f}, {-1.0f, 0.0f, 0.0f}});
    report("Extrude", tool.confirm());

    // Cut the front panel off
    auto front = camera.worldToScreen({0.1f, 0.4f, -3.5f}, viewport);
    if (front && tool.click(camera.screenToWorldRay(*front, viewport), camera, viewport, false)) {
        tool.setOperation(ModelOperation::Cut);
        report("Cut", tool.confirm());
    }

    // Cutting everything is refused
    tool.selectAll();
    tool.setOperation(ModelOperation::Cut);
    report("Cut all", tool.confirm());

    tool.escape();
    tool.escape();
    scene.printSummary();
    return 0;
}
