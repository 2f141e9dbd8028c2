// tests/FormationGroupingTest.cpp
//
// Grouped moves: nobody disperses before every surviving member has arrived,
// the dispersal grid, and slot assignment order.

#include "control/AssignmentStrategy.h"
#include "control/FormationPattern.h"
#include "core/Scenario.h"
#include "core/Simulation.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

static SimulationConfig emptyWorldConfig() {
    SimulationConfig cfg;
    cfg.populateDefaultScenario = false;
    return cfg;
}

static bool allIdle(const Simulation& sim, const std::vector<std::string>& ids) {
    for (const auto& id : ids) {
        const Drone* d = sim.getWorld().findDrone(id);
        if (!d || d->mode != DroneMode::IDLE) return false;
    }
    return true;
}

// ============================================================================
//                                 TESTS
// ============================================================================

static void test_grid_layout() {
    std::cout << "\n=== TEST: grid layout ===\n";

    FormationPattern four = FormationPattern::makeGrid("g", Vec2(0.0, 0.0), 4, 20.0);
    assert(four.size() == 4);
    assert(glm::distance(four.centroid(), Vec2(0.0, 0.0)) < 1e-9);
    assert(four.slots[0] == Vec2(-10.0, -10.0));
    assert(four.slots[3] == Vec2(10.0, 10.0));

    // 5 drones: 3 columns, 2 rows, filled row by row.
    FormationPattern five = FormationPattern::makeGrid("g", Vec2(100.0, 100.0), 5, 20.0);
    assert(five.size() == 5);
    assert(five.slots[0] == Vec2(80.0, 90.0));
    assert(five.slots[2] == Vec2(120.0, 90.0));
    assert(five.slots[4] == Vec2(100.0, 110.0));

    FormationPattern one = FormationPattern::makeGrid("g", Vec2(7.0, 9.0), 1, 20.0);
    assert(one.size() == 1 && one.slots[0] == Vec2(7.0, 9.0));

    assert(FormationPattern::makeGrid("g", Vec2(0.0), 0, 20.0).empty());

    bool threw = false;
    try {
        FormationPattern::makeGrid("g", Vec2(0.0), -1, 20.0);
    }
    catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

static void test_assignment_order() {
    std::cout << "\n=== TEST: slots are assigned in id order ===\n";

    FormationPattern grid = FormationPattern::makeGrid("g", Vec2(0.0, 0.0), 3, 10.0);
    auto assignments = AssignmentStrategy::assignDronesToPattern({ "c", "a", "b" }, grid);

    assert(assignments.size() == 3);
    assert(assignments[0].droneId == "a" && assignments[0].targetPos == grid.slots[0]);
    assert(assignments[1].droneId == "b" && assignments[1].targetPos == grid.slots[1]);
    assert(assignments[2].droneId == "c" && assignments[2].targetPos == grid.slots[2]);
    assert(assignments[2].logicalIndex == 2);

    // More drones than slots: the extras get nothing.
    auto partial = AssignmentStrategy::assignDronesToPattern({ "d", "a", "b", "c" }, grid);
    assert(partial.size() == 3 && partial.back().droneId == "c");
}

static void test_no_early_dispersal() {
    std::cout << "\n=== TEST: group waits for the slowest member ===\n";

    SimulationConfig cfg = emptyWorldConfig();
    Simulation sim(cfg);
    std::vector<std::string> ids = { "f1", "f2", "f3" };
    sim.addDrone(Scenario::makeFriendly("f1", Vec2(500.0, 300.0), cfg));   // nearly there
    sim.addDrone(Scenario::makeFriendly("f2", Vec2(100.0, 300.0), cfg));
    sim.addDrone(Scenario::makeFriendly("f3", Vec2(100.0, 700.0), cfg));   // farthest

    const Vec2 destination(600.0, 300.0);
    CommandResult r = sim.issueMove(MoveCommand{ ids, destination.x, destination.y });
    assert(r.ok() && r.updatedDrones == 3);
    assert(sim.getWorld().groups.size() == 1);

    int resolvedAt = -1;
    for (int i = 1; i <= 400; ++i) {
        sim.step();
        if (sim.getWorld().groups.empty()) {
            resolvedAt = i;
            break;
        }
        // Until the group resolves every member is still "moving", even the
        // ones parked on the destination.
        for (const auto& id : ids) {
            const Drone* d = sim.getWorld().findDrone(id);
            assert(d->mode == DroneMode::MOVING);
            assert(d->groupId.has_value());
        }
    }
    assert(resolvedAt > 0);

    // f3 has sqrt(500^2 + 400^2) ~ 640 units to fly at 4 units per tick.
    int slowest = static_cast<int>(std::ceil((std::sqrt(500.0 * 500.0 + 400.0 * 400.0) - cfg.arrivalThreshold)
        / (cfg.friendlySpeed * cfg.timeStep)));
    std::cout << "  group resolved at tick " << resolvedAt << " (slowest ~" << slowest << ")\n";
    assert(resolvedAt >= slowest);

    for (int i = 0; i < 100 && !allIdle(sim, ids); ++i) sim.step();
    assert(allIdle(sim, ids));

    // Settled on a 2x2 grid (3 cells used) around the destination.
    FormationPattern grid = FormationPattern::makeGrid("expected", destination, 3, cfg.formationSpacing);
    for (std::size_t i = 0; i < ids.size(); ++i) {
        const Drone* d = sim.getWorld().findDrone(ids[i]);
        assert(glm::distance(d->position, grid.slots[i]) < 1e-6);
        assert(!d->groupId);
    }
}

static void test_destroyed_member_does_not_block() {
    std::cout << "\n=== TEST: destroyed member drops out of the group ===\n";

    SimulationConfig cfg = emptyWorldConfig();
    Simulation sim(cfg);
    sim.addDrone(Scenario::makeFriendly("fa", Vec2(100.0, 300.0), cfg));
    sim.addDrone(Scenario::makeFriendly("fb", Vec2(100.0, 500.0), cfg));
    // Parked right on fb's straight-line path.
    sim.addDrone(makeDrone("e1", Team::ENEMY, Vec2(300.0, 500.0), cfg.droneRadius));

    sim.issueMove(MoveCommand{ { "fa", "fb" }, 600.0, 500.0 });

    bool sawCollision = false;
    for (int i = 0; i < 300; ++i) {
        sim.step();
        if (!sim.getLastCollisions().empty()) sawCollision = true;
        if (sim.getWorld().groups.empty()) break;
    }

    assert(sawCollision);
    assert(!sim.getWorld().findDrone("fb"));
    assert(!sim.getWorld().findDrone("e1"));
    assert(sim.getWorld().groups.empty());

    // A lone survivor's grid cell is the destination itself.
    const Drone* fa = sim.getWorld().findDrone("fa");
    assert(fa->mode == DroneMode::IDLE);
    assert(glm::distance(fa->position, Vec2(600.0, 500.0)) < 1e-6);
}

static void test_retask_leaves_group() {
    std::cout << "\n=== TEST: re-tasked member leaves its group ===\n";

    SimulationConfig cfg = emptyWorldConfig();
    Simulation sim(cfg);
    sim.addDrone(Scenario::makeFriendly("f1", Vec2(100.0, 100.0), cfg));
    sim.addDrone(Scenario::makeFriendly("f2", Vec2(100.0, 200.0), cfg));

    sim.issueMove(MoveCommand{ { "f1", "f2" }, 800.0, 800.0 });
    int gid = sim.getWorld().groups.begin()->first;

    CommandResult r = sim.issueTask(TaskRequest{ "hold", { "f2" }, {} });
    assert(r.ok());

    const CommandGroup& group = sim.getWorld().groups.at(gid);
    assert(group.memberIds.size() == 1 && group.memberIds.count("f1") == 1);
    assert(sim.getWorld().findDrone("f2")->mode == DroneMode::HOLDING);
    assert(!sim.getWorld().findDrone("f2")->groupId);

    // A fresh move on the same drone creates a new group with a new id.
    sim.issueMove(MoveCommand{ { "f1" }, 500.0, 500.0 });
    assert(sim.getWorld().groups.size() == 1);
    assert(sim.getWorld().groups.begin()->first > gid);
}

static void test_group_at_world_corner_settles() {
    std::cout << "\n=== TEST: group sent to the world corner goes idle ===\n";

    SimulationConfig cfg = emptyWorldConfig();
    Simulation sim(cfg);
    const std::vector<std::string> ids = { "c1", "c2", "c3", "c4" };
    sim.addDrone(Scenario::makeFriendly("c1", Vec2(940.0, 940.0), cfg));
    sim.addDrone(Scenario::makeFriendly("c2", Vec2(960.0, 940.0), cfg));
    sim.addDrone(Scenario::makeFriendly("c3", Vec2(940.0, 960.0), cfg));
    sim.addDrone(Scenario::makeFriendly("c4", Vec2(960.0, 960.0), cfg));

    CommandResult r = sim.issueMove(MoveCommand{ ids, 1000.0, 1000.0 });
    assert(r.ok() && r.updatedDrones == 4);

    for (int i = 0; i < 200 && !allIdle(sim, ids); ++i) sim.step();

    assert(allIdle(sim, ids));
    assert(sim.getWorld().groups.empty());
    for (const auto& id : ids) {
        const Drone* d = sim.getWorld().findDrone(id);
        assert(d->position.x >= 0.0 && d->position.x <= cfg.worldWidth);
        assert(d->position.y >= 0.0 && d->position.y <= cfg.worldHeight);
        assert(d->velocity == Vec2(0.0));
    }

    // A lone drone told to fly off the map stops on the edge.
    sim.addDrone(Scenario::makeFriendly("lone", Vec2(900.0, 500.0), cfg));
    sim.issueMove(MoveCommand{ { "lone" }, 1200.0, 500.0 });
    for (int i = 0; i < 200 && !allIdle(sim, { "lone" }); ++i) sim.step();

    const Drone* lone = sim.getWorld().findDrone("lone");
    assert(lone->mode == DroneMode::IDLE);
    assert(glm::distance(lone->position, Vec2(1000.0, 500.0)) < 1e-9);
}

int main() {
    test_grid_layout();
    test_assignment_order();
    test_no_early_dispersal();
    test_destroyed_member_does_not_block();
    test_retask_leaves_group();
    test_group_at_world_corner_settles();

    std::cout << "\nAll formation grouping tests passed.\n";
    return 0;
}
