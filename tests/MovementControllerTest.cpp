// tests/MovementControllerTest.cpp
//
// Point-to-point movement: arrival timing, idle transition and world clamping.

#include "core/Scenario.h"
#include "core/Simulation.h"

#include <cassert>
#include <cmath>
#include <iostream>

static SimulationConfig emptyWorldConfig() {
    SimulationConfig cfg;
    cfg.populateDefaultScenario = false;
    return cfg;
}

static bool near(const Vec2& a, const Vec2& b, double eps = 1e-6) {
    return glm::distance(a, b) <= eps;
}

// ============================================================================
//                                 TESTS
// ============================================================================

static void test_straight_line_arrival() {
    std::cout << "\n=== TEST: (0,0) -> (400,0) arrives at tick 100 ===\n";

    SimulationConfig cfg = emptyWorldConfig();
    Simulation sim(cfg);
    sim.addDrone(Scenario::makeFriendly("d1", Vec2(0.0, 0.0), cfg));

    CommandResult r = sim.issueMove(MoveCommand{ { "d1" }, 400.0, 0.0 });
    assert(r.ok());
    assert(r.updatedDrones == 1);

    for (int i = 0; i < 50; ++i) sim.step();
    const Drone* d = sim.getWorld().findDrone("d1");
    assert(d);
    assert(near(d->position, Vec2(200.0, 0.0)));
    assert(d->mode == DroneMode::MOVING);
    std::cout << "  tick 50 position (" << d->position.x << ", " << d->position.y << ")\n";

    for (int i = 50; i < 99; ++i) sim.step();
    d = sim.getWorld().findDrone("d1");
    assert(sim.getTick() == 99);
    assert(d->mode == DroneMode::MOVING && "must not arrive before tick 100");
    assert(glm::distance(d->position, Vec2(400.0, 0.0)) > 0.0);

    sim.step();
    d = sim.getWorld().findDrone("d1");
    assert(sim.getTick() == 100);
    assert(d->mode == DroneMode::IDLE);
    assert(near(d->position, Vec2(400.0, 0.0)));
    assert(!d->target);
    assert(sim.getWorld().groups.empty());

    std::cout << "  idle at tick " << sim.getTick() << "\n";
}

static void test_arrival_bound_for_diagonal_move() {
    std::cout << "\n=== TEST: arrival within ceil(D / (S*dt)) ticks ===\n";

    SimulationConfig cfg = emptyWorldConfig();
    Simulation sim(cfg);
    sim.addDrone(Scenario::makeFriendly("d1", Vec2(120.0, 80.0), cfg));

    Vec2 target(530.0, 410.0);
    double distance = glm::distance(Vec2(120.0, 80.0), target);
    int bound = static_cast<int>(std::ceil(distance / (cfg.friendlySpeed * cfg.timeStep)));

    sim.issueMove(MoveCommand{ { "d1" }, target.x, target.y });

    int arrivedAt = -1;
    for (int i = 1; i <= bound + 5; ++i) {
        sim.step();
        if (sim.getWorld().findDrone("d1")->mode == DroneMode::IDLE) {
            arrivedAt = i;
            break;
        }
    }

    assert(arrivedAt > 0 && arrivedAt <= bound);
    assert(near(sim.getWorld().findDrone("d1")->position, target));
    std::cout << "  arrived at tick " << arrivedAt << " (bound " << bound << ")\n";
}

static void test_unknown_ids_are_ignored() {
    std::cout << "\n=== TEST: unknown ids in a move are ignored ===\n";

    SimulationConfig cfg = emptyWorldConfig();
    Simulation sim(cfg);
    sim.addDrone(Scenario::makeFriendly("d1", Vec2(0.0, 0.0), cfg));

    CommandResult r = sim.issueMove(MoveCommand{ { "ghost", "d1" }, 100.0, 0.0 });
    assert(r.ok());
    assert(r.updatedDrones == 1);
    assert(r.ignoredIds.size() == 1 && r.ignoredIds[0] == "ghost");

    const auto& groups = sim.getWorld().groups;
    assert(groups.size() == 1);
    assert(groups.begin()->second.memberIds.size() == 1);
    assert(groups.begin()->second.memberIds.count("d1") == 1);

    CommandResult none = sim.issueMove(MoveCommand{ {}, 100.0, 0.0 });
    assert(!none.ok() && none.error == CommandError::SCHEMA);
}

static void test_clamp_to_world() {
    std::cout << "\n=== TEST: positions clamp to world bounds ===\n";

    SimulationConfig cfg = emptyWorldConfig();
    MovementController movement(cfg);

    Vec2 p = movement.clampToWorld(Vec2(-5.0, 1200.0));
    assert(near(p, Vec2(0.0, 1000.0)));

    // A goal beyond the edge is reached at the edge.
    Drone d = Scenario::makeFriendly("d1", Vec2(990.0, 500.0), cfg);
    bool arrived = movement.advanceToward(d, Vec2(1500.0, 500.0), cfg.timeStep);
    assert(!arrived);
    assert(d.position.x > 990.0 && d.position.x < 1000.0);

    int ticks = 1;
    while (!movement.advanceToward(d, Vec2(1500.0, 500.0), cfg.timeStep)) {
        assert(++ticks < 10);
    }
    assert(d.position == Vec2(1000.0, 500.0));
    assert(d.velocity == Vec2(0.0));

    cfg.clampToWorld = false;
    MovementController loose(cfg);
    assert(near(loose.clampToWorld(Vec2(-5.0, 1200.0)), Vec2(-5.0, 1200.0)));
}

static void test_return_to_base_goes_idle() {
    std::cout << "\n=== TEST: return_to_base ends idle at the base ===\n";

    SimulationConfig cfg = emptyWorldConfig();
    Simulation sim(cfg);
    sim.addBase(Base{ "home", Vec2(100.0, 100.0), BaseShape::SQUARE, "Home" });
    Drone d = Scenario::makeFriendly("d1", Vec2(300.0, 100.0), cfg);
    d.baseId = "home";
    sim.addDrone(d);

    CommandResult r = sim.issueTask(TaskRequest{ "return_to_base", { "d1" }, {} });
    assert(r.ok() && r.updatedDrones == 1);
    assert(sim.getWorld().findDrone("d1")->mode == DroneMode::RETURNING);

    for (int i = 0; i < 60; ++i) sim.step();
    const Drone* back = sim.getWorld().findDrone("d1");
    assert(back->mode == DroneMode::IDLE);
    assert(near(back->position, Vec2(100.0, 100.0)));
    assert(sim.getWorld().groups.empty());
}

int main() {
    test_straight_line_arrival();
    test_arrival_bound_for_diagonal_move();
    test_unknown_ids_are_ignored();
    test_clamp_to_world();
    test_return_to_base_goes_idle();

    std::cout << "\nAll movement tests passed.\n";
    return 0;
}
