#include "polyscope/polyscope.h"
#include "polyscope/curve_network.h"
#include "polyscope/point_cloud.h"

#include "command/TaskRegistry.h"
#include "visualization/PolyscopeRenderer.h"
#include "util/Logger.h"

#include <algorithm>
#include <array>
#include <string>
#include <vector>

// ============================================================================
//  Local helpers
// ============================================================================

namespace {

    // World plane (x, y) -> polyscope XZ plane.
    glm::vec3 toScene(const Vec2& p) {
        return glm::vec3(static_cast<float>(p.x), 0.0f, static_cast<float>(p.y));
    }

    glm::vec3 colorFor(const DroneView& d) {
        if (d.team == Team::ENEMY) {
            return { 1.0f, 0.15f, 0.15f };
        }
        switch (d.mode) {
        case DroneMode::IDLE:         return { 0.2f, 0.6f, 1.0f };
        case DroneMode::MOVING:       return { 0.1f, 1.0f, 0.4f };
        case DroneMode::PATROLLING:   return { 0.9f, 0.9f, 0.2f };
        case DroneMode::TAILING:      return { 1.0f, 0.6f, 0.1f };
        case DroneMode::INTERCEPTING: return { 1.0f, 0.2f, 1.0f };
        case DroneMode::HOLDING:      return { 0.6f, 0.6f, 0.6f };
        case DroneMode::RETURNING:    return { 0.3f, 1.0f, 1.0f };
        case DroneMode::DESTROYED:    return { 0.0f, 0.0f, 0.0f };
        }
        return { 1.0f, 1.0f, 1.0f };
    }

    glm::vec3 colorFor(BaseShape shape) {
        switch (shape) {
        case BaseShape::SQUARE:   return { 0.9f, 0.9f, 0.9f };
        case BaseShape::CIRCLE:   return { 0.7f, 0.9f, 0.7f };
        case BaseShape::TRIANGLE: return { 0.9f, 0.8f, 0.6f };
        }
        return { 1.0f, 1.0f, 1.0f };
    }

} // anonymous namespace


// ============================================================================
//  PolyscopeRenderer implementation
// ============================================================================

PolyscopeRenderer::PolyscopeRenderer(Simulation* sim)
    : sim(sim) {
}

void PolyscopeRenderer::initialize() {
    polyscope::init();
    polyscope::options::buildGui = false;
    polyscope::options::groundPlaneMode = polyscope::GroundPlaneMode::None;
    polyscope::view::bgColor = { 0.05f, 0.05f, 0.08f, 1.0f };

    sim->setResultCallback([this](const ControlCommand&, const CommandResult& r) {
        lastResult = (r.ok() ? "OK: " : "REJECTED: ") + r.message
            + " (" + std::to_string(r.updatedDrones) + " drones)";
        if (!r.ignoredIds.empty()) {
            lastResult += ", ignored " + std::to_string(r.ignoredIds.size());
        }
    });

    staged = sim->getConfig();
    rebuildAllVisuals();

    // Main loop callback: one fixed tick per frame, then redraw.
    polyscope::state::userCallback = [this]() {
        sim->step();

        WorldView view = sim->queryWorld();
        updateDrones(view);
        updateTargets(view);

        drawUI();
    };
}

void PolyscopeRenderer::renderLoop() {
    polyscope::show();
}

// ============================================================================
//   UI Panel
// ============================================================================

void PolyscopeRenderer::drawUI() {
    WorldView view = sim->queryWorld();

    ImGui::Begin("Swarm Simulator");

    // ------------------------------------------------------------------------
    // STATUS DISPLAY - Always visible
    // ------------------------------------------------------------------------
    ImGui::SeparatorText("Status");

    int friendly = 0;
    int enemy = 0;
    for (const auto& d : view.drones) {
        if (d.team == Team::FRIENDLY) friendly++;
        else enemy++;
    }

    ImGui::Text("Tick: %lld  Time: %.2f s", (long long)view.tick, view.time);
    ImGui::Text("Clock: %s", toString(view.clock));
    ImGui::Text("Friendly: %d  Enemy: %d  Groups: %d", friendly, enemy,
        (int)sim->getWorld().groups.size());
    ImGui::Text("History: %d / %d", (int)view.historySize,
        (int)sim->getHistory().capacity());

    for (const auto& c : sim->getLastCollisions()) {
        ImGui::TextColored(ImVec4(1.0f, 0.3f, 0.3f, 1.0f), "COLLISION: %s x %s",
            c.friendlyId.c_str(), c.enemyId.c_str());
    }

    // ------------------------------------------------------------------------
    // TIME CONTROL
    // ------------------------------------------------------------------------
    ImGui::SeparatorText("Time");

    auto& mailbox = sim->getMailbox();
    bool paused = view.clock == ClockState::PAUSED;
    if (ImGui::Button(paused ? "Resume" : "Pause", ImVec2(80, 0))) {
        mailbox.post(PauseCommand{ !paused });
    }
    ImGui::SameLine();
    if (ImGui::Button("Reverse", ImVec2(80, 0))) {
        mailbox.post(TimeControlCommand{ TimeDirection::REVERSE });
    }
    ImGui::SameLine();
    if (ImGui::Button("Forward", ImVec2(80, 0))) {
        mailbox.post(TimeControlCommand{ TimeDirection::FORWARD });
    }
    if (ImGui::Button("Jump Back", ImVec2(80, 0))) {
        mailbox.post(JumpBackCommand{});
    }
    ImGui::SameLine();
    if (ImGui::Button("Reset", ImVec2(80, 0))) {
        mailbox.post(ResetCommand{});
        selected.clear();
    }

    // ------------------------------------------------------------------------
    // COMMANDS
    // ------------------------------------------------------------------------
    drawCommandPanel(view);

    // ------------------------------------------------------------------------
    // VISUALIZATION + LOGGING
    // ------------------------------------------------------------------------
    if (ImGui::CollapsingHeader("Visualization")) {
        ImGui::Checkbox("Target Lines", &showTargets);
    }

    if (ImGui::CollapsingHeader("Console Logging")) {
        ImGui::Checkbox("Enable Logging", &Log::enabled);
        if (Log::enabled) {
            ImGui::Checkbox("Commands", &Log::showCommands);
            ImGui::SameLine();
            ImGui::Checkbox("Control", &Log::showControl);
            ImGui::Checkbox("Collisions", &Log::showCollisions);
            ImGui::SameLine();
            ImGui::Checkbox("History", &Log::showHistory);
        }
    }

    // ------------------------------------------------------------------------
    // SIMULATION PARAMETERS (staged, applied through a reset)
    // ------------------------------------------------------------------------
    if (ImGui::CollapsingHeader("Parameters")) {
        float friendlySpeed = (float)staged.friendlySpeed;
        if (ImGui::SliderFloat("Friendly Speed", &friendlySpeed, 20.0f, 400.0f, "%.0f"))
            staged.friendlySpeed = friendlySpeed;

        float enemySpeed = (float)staged.enemySpeed;
        if (ImGui::SliderFloat("Enemy Speed", &enemySpeed, 5.0f, 200.0f, "%.0f"))
            staged.enemySpeed = enemySpeed;

        float deadZone = (float)staged.tailDeadZone;
        if (ImGui::SliderFloat("Tail Dead Zone", &deadZone, 0.5f, 20.0f, "%.1f"))
            staged.tailDeadZone = deadZone;

        float drift = (float)staged.interceptDriftThreshold;
        if (ImGui::SliderFloat("Intercept Drift", &drift, 1.0f, 50.0f, "%.1f"))
            staged.interceptDriftThreshold = drift;

        if (ImGui::Button("Apply (resets world)")) {
            sim->getMailbox().post(ResetCommand{ staged });
            selected.clear();
        }
        ImGui::SameLine();
        if (ImGui::Button("Revert")) {
            staged = sim->getConfig();
        }
    }

    ImGui::End();
}

void PolyscopeRenderer::drawCommandPanel(const WorldView& view) {
    if (!ImGui::CollapsingHeader("Commands", ImGuiTreeNodeFlags_DefaultOpen)) {
        return;
    }

    std::vector<std::string> enemyIds;
    for (const auto& d : view.drones) {
        if (d.team == Team::ENEMY) enemyIds.push_back(d.id);
    }

    // Selection
    ImGui::Text("Selection:");
    if (ImGui::SmallButton("All")) {
        for (const auto& d : view.drones) {
            if (d.team == Team::FRIENDLY) selected.insert(d.id);
        }
    }
    ImGui::SameLine();
    if (ImGui::SmallButton("None")) {
        selected.clear();
    }

    int column = 0;
    for (const auto& d : view.drones) {
        if (d.team != Team::FRIENDLY) continue;
        bool on = selected.count(d.id) > 0;
        if (column % 4 != 0) ImGui::SameLine();
        if (ImGui::Checkbox(d.id.c_str(), &on)) {
            if (on) selected.insert(d.id);
            else selected.erase(d.id);
        }
        column++;
    }

    std::vector<std::string> ids(selected.begin(), selected.end());

    // Move
    ImGui::Separator();
    ImGui::SliderFloat("Target X", &targetX, 0.0f, (float)sim->getConfig().worldWidth, "%.0f");
    ImGui::SliderFloat("Target Y", &targetY, 0.0f, (float)sim->getConfig().worldHeight, "%.0f");
    if (ImGui::Button("Move Selected") && !ids.empty()) {
        sim->getMailbox().post(MoveCommand{ ids, targetX, targetY });
    }

    // Tasks
    ImGui::Separator();
    const auto& names = TaskRegistry::names();
    std::vector<const char*> labels;
    for (const auto& n : names) labels.push_back(n.c_str());
    ImGui::Combo("Task", &taskIndex, labels.data(), (int)labels.size());

    std::vector<const char*> enemyLabels;
    for (const auto& e : enemyIds) enemyLabels.push_back(e.c_str());
    if (!enemyLabels.empty()) {
        targetIndex = std::min(targetIndex, (int)enemyLabels.size() - 1);
        ImGui::Combo("Enemy", &targetIndex, enemyLabels.data(), (int)enemyLabels.size());
    }
    ImGui::SliderFloat("Tail Distance", &tailDistance, 10.0f, 300.0f, "%.0f");
    ImGui::SliderFloat("Patrol Radius", &patrolRadius, 20.0f, 300.0f, "%.0f");

    if (ImGui::Button("Assign Task") && !ids.empty()) {
        const std::string& name = names[taskIndex];
        sim->getMailbox().post(TaskRequest{ name, ids, buildTaskParameters(name, enemyIds) });
    }

    if (!lastResult.empty()) {
        ImGui::TextWrapped("%s", lastResult.c_str());
    }
}

TaskParameters PolyscopeRenderer::buildTaskParameters(const std::string& taskName,
    const std::vector<std::string>& enemyIds) const
{
    TaskParameters params;
    std::string enemy = enemyIds.empty() ? std::string() : enemyIds[std::min<std::size_t>(targetIndex, enemyIds.size() - 1)];

    if (taskName == "move") {
        params["x"] = (double)targetX;
        params["y"] = (double)targetY;
    }
    else if (taskName == "patrol") {
        params["pattern"] = std::string("circle");
        params["center_x"] = (double)targetX;
        params["center_y"] = (double)targetY;
        params["radius"] = (double)patrolRadius;
    }
    else if (taskName == "tail") {
        params["target_id"] = enemy;
        params["distance"] = (double)tailDistance;
    }
    else if (taskName == "intercept") {
        params["target_id"] = enemy;
    }
    return params;
}

// ============================================================================
//   POSITION + COLOR UPDATES
// ============================================================================

void PolyscopeRenderer::updateDrones(const WorldView& view) {
    std::vector<glm::vec3> positions;
    std::vector<glm::vec3> colors;
    positions.reserve(view.drones.size());
    colors.reserve(view.drones.size());

    for (const auto& d : view.drones) {
        positions.push_back(toScene(d.position));
        colors.push_back(colorFor(d));
    }

    // Collisions and resets change the point count; polyscope needs a fresh
    // structure for that.
    if (!droneCloud || positions.size() != lastDroneCount) {
        polyscope::removePointCloud("drones", false);
        droneCloud = polyscope::registerPointCloud("drones", positions);
        droneCloud->setPointRadius(sim->getConfig().droneRadius, false);
        lastDroneCount = positions.size();
        buildBases(view);
    }
    else {
        droneCloud->updatePointPositions(positions);
    }

    droneCloud->addColorQuantity("modeColor", colors)->setEnabled(true);
}

void PolyscopeRenderer::updateTargets(const WorldView& view) {
    if (targetNet) {
        polyscope::removeCurveNetwork("targets", false);
        targetNet = nullptr;
    }
    if (!showTargets) return;

    std::vector<glm::vec3> pts;
    std::vector<std::array<size_t, 2>> edges;

    for (const auto& d : view.drones) {
        if (!d.target) continue;
        pts.push_back(toScene(d.position));
        pts.push_back(toScene(*d.target));
        edges.push_back({ pts.size() - 2, pts.size() - 1 });
    }
    if (edges.empty()) return;

    targetNet = polyscope::registerCurveNetwork("targets", pts, edges);
    targetNet->setRadius(1.0f, false);
    targetNet->setColor(glm::vec3(0.3f, 0.8f, 0.3f));
}

void PolyscopeRenderer::buildBases(const WorldView& view) {
    std::vector<glm::vec3> positions;
    std::vector<glm::vec3> colors;
    for (const auto& b : view.bases) {
        positions.push_back(toScene(b.position));
        colors.push_back(colorFor(b.shape));
    }

    polyscope::removePointCloud("bases", false);
    baseCloud = polyscope::registerPointCloud("bases", positions);
    baseCloud->setPointRadius(2.0 * sim->getConfig().droneRadius, false);
    baseCloud->addColorQuantity("shape", colors)->setEnabled(true);
}

// ============================================================================
//  Support for Reset
// ============================================================================

void PolyscopeRenderer::rebuildAllVisuals() {
    droneCloud = nullptr;
    lastDroneCount = 0;

    WorldView view = sim->queryWorld();
    updateDrones(view);
    updateTargets(view);
}
