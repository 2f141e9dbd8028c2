// =============================================================================
// Swarm Simulator
//
// Friendly drones under operator command against patterned enemy drones, on
// a fixed 50 Hz step with a rewindable history. Select drones, send them
// somewhere, set them on an enemy, then pause, reverse or jump back and try
// again.
// =============================================================================

#include "core/Simulation.h"
#include "visualization/PolyscopeRenderer.h"

#include <exception>
#include <iostream>

int main() {
    // Default configuration - the standard scenario at 50 Hz
    SimulationConfig config;

    try {
        Simulation sim(config);
        PolyscopeRenderer renderer(&sim);
        renderer.initialize();
        renderer.renderLoop();
    }
    catch (const std::exception& e) {
        std::cerr << "swarm_viewer: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
