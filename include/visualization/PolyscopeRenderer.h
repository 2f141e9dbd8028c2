#pragma once
#include <set>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "polyscope/polyscope.h"
#include "polyscope/point_cloud.h"
#include "polyscope/curve_network.h"

#include "core/Simulation.h"


// Interactive front end. Draws the world in the XZ plane and turns panel
// clicks into structured commands posted to the simulation's mailbox.
class PolyscopeRenderer {
public:
    PolyscopeRenderer(Simulation* sim);
    PolyscopeRenderer() = default;

    // Build all polyscope structures
    void initialize();

    // Block until window closes
    void renderLoop();

    // Rebuild visuals after a reset
    void rebuildAllVisuals();

private:
    Simulation* sim = nullptr;

    polyscope::PointCloud* droneCloud = nullptr;
    polyscope::PointCloud* baseCloud = nullptr;
    polyscope::CurveNetwork* targetNet = nullptr;

    // UI toggles
    bool showTargets = true;

    // Command panel state
    std::set<std::string> selected;
    float targetX = 500.0f;
    float targetY = 500.0f;
    int taskIndex = 0;
    int targetIndex = 0;
    float tailDistance = 100.0f;
    float patrolRadius = 100.0f;
    std::string lastResult;

    // Parameter edits wait here until posted with a reset.
    SimulationConfig staged;

    std::size_t lastDroneCount = 0;

    // === Internal updates ===
    void drawUI();
    void drawCommandPanel(const WorldView& view);
    void updateDrones(const WorldView& view);
    void updateTargets(const WorldView& view);
    void buildBases(const WorldView& view);

    TaskParameters buildTaskParameters(const std::string& taskName,
        const std::vector<std::string>& enemyIds) const;
};
