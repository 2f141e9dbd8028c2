// tests/SimulationClockTest.cpp
//
// Fixed-step clock: pause, reverse playback, forward resume, jump-back,
// reset, and mailbox commands landing on tick boundaries.

#include "core/Scenario.h"
#include "core/Simulation.h"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

static SimulationConfig emptyWorldConfig() {
    SimulationConfig cfg;
    cfg.populateDefaultScenario = false;
    return cfg;
}

static void runTicks(Simulation& sim, int n) {
    for (int i = 0; i < n; ++i) sim.step();
}

// ============================================================================
//                                 TESTS
// ============================================================================

static void test_default_scenario() {
    std::cout << "\n=== TEST: default world ===\n";

    Simulation sim(SimulationConfig{});
    const WorldState& world = sim.getWorld();

    int friendly = 0;
    int enemy = 0;
    for (const auto& [id, d] : world.drones) {
        if (d.isFriendly()) {
            ++friendly;
            assert(d.mode == DroneMode::IDLE);
            assert(d.baseId && world.findBase(*d.baseId));
        }
        else {
            ++enemy;
            assert(d.mode == DroneMode::PATROLLING);
        }
    }
    assert(friendly == 12 && enemy == 3);
    assert(world.bases.size() == 3);
    assert(world.findDrone("drone_1")->position == Vec2(200.0, 200.0));
    assert(world.findDrone("drone_12")->position == Vec2(440.0, 360.0));
    assert(sim.getHistory().empty());
    assert(sim.getClockState() == ClockState::RUNNING_FORWARD);
}

static void test_pause_freezes_world() {
    std::cout << "\n=== TEST: pause freezes tick and positions ===\n";

    Simulation sim(SimulationConfig{});
    runTicks(sim, 10);

    sim.setPaused(true);
    assert(sim.getClockState() == ClockState::PAUSED);

    auto before = sim.getWorld().drones;
    int64_t tick = sim.getTick();
    std::size_t recorded = sim.getHistory().size();

    runTicks(sim, 25);
    assert(sim.getTick() == tick);
    assert(sim.getWorld().drones == before);
    assert(sim.getHistory().size() == recorded);

    sim.setPaused(false);
    assert(sim.getClockState() == ClockState::RUNNING_FORWARD);
    sim.step();
    assert(sim.getTick() == tick + 1);
}

static void test_reverse_then_forward() {
    std::cout << "\n=== TEST: reverse walks back one snapshot per tick ===\n";

    Simulation sim(SimulationConfig{});
    runTicks(sim, 30);
    const Vec2 at20 = [&] {
        Simulation probe(SimulationConfig{});
        runTicks(probe, 20);
        return probe.getWorld().findDrone("enemy_1")->position;
    }();

    sim.setTimeDirection(TimeDirection::REVERSE);
    assert(sim.getClockState() == ClockState::REVERSING);
    runTicks(sim, 10);
    assert(sim.getTick() == 20);
    assert(sim.getWorld().findDrone("enemy_1")->position == at20);

    // Reverse past the oldest snapshot: stays at tick 1.
    runTicks(sim, 100);
    assert(sim.getTick() == 1);
    assert(sim.getClockState() == ClockState::REVERSING);

    sim.setTimeDirection(TimeDirection::FORWARD);
    sim.step();
    assert(sim.getTick() == 2);
    assert(sim.getHistory().size() == 2 && "forward from the past discards the old future");
}

static void test_runs_are_deterministic() {
    std::cout << "\n=== TEST: identical inputs give identical worlds ===\n";

    Simulation a(SimulationConfig{});
    Simulation b(SimulationConfig{});
    for (Simulation* sim : { &a, &b }) {
        sim->issueMove(MoveCommand{ { "drone_1", "drone_2", "drone_3" }, 700.0, 600.0 });
        sim->issueTask(TaskRequest{ "intercept", { "drone_12" },
            { { "target_id", std::string("enemy_3") } } });
        runTicks(*sim, 200);
    }
    assert(a.getWorld().drones == b.getWorld().drones);
    assert(a.getWorld().groups == b.getWorld().groups);
}

static void test_jump_back() {
    std::cout << "\n=== TEST: jump-back restores and resumes forward ===\n";

    SimulationConfig cfg;
    cfg.historyCapacity = 100;
    cfg.jumpBackTicks = 40;
    Simulation sim(cfg);

    runTicks(sim, 150);
    assert(sim.getHistory().size() == 100);
    assert(sim.getHistory().oldest().tick == 51);

    const HistorySnapshot expected = sim.getHistory().at(sim.getHistory().getCursor() - 40);

    sim.setPaused(true);
    CommandResult r = sim.jumpBack();
    assert(r.ok());
    assert(sim.getTick() == 110);
    assert(sim.getWorld().drones == expected.drones);
    assert(sim.getClockState() == ClockState::RUNNING_FORWARD);

    // A second and third jump clamp at the oldest retained tick.
    sim.jumpBack();
    sim.jumpBack();
    assert(sim.getTick() == 51);
}

static void test_reset_is_atomic() {
    std::cout << "\n=== TEST: reset clears world and history together ===\n";

    Simulation sim(SimulationConfig{});
    sim.issueMove(MoveCommand{ { "drone_1", "drone_2" }, 800.0, 800.0 });
    runTicks(sim, 40);
    sim.setTimeDirection(TimeDirection::REVERSE);

    sim.reset();
    assert(sim.getTick() == 0);
    assert(sim.getHistory().empty());
    assert(sim.getWorld().groups.empty());
    assert(sim.getWorld().drones.size() == 15);
    assert(sim.getClockState() == ClockState::RUNNING_FORWARD);
    assert(sim.getWorld().findDrone("drone_1")->position == Vec2(200.0, 200.0));

    // A bad config is refused and leaves the running world as it was.
    runTicks(sim, 5);
    SimulationConfig bad;
    bad.historyCapacity = 0;
    bool threw = false;
    try {
        sim.reset(bad);
    }
    catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(sim.getTick() == 5);
    assert(sim.getHistory().size() == 5);

    SimulationConfig empty = emptyWorldConfig();
    sim.reset(empty);
    assert(sim.getWorld().drones.empty() && sim.getWorld().bases.empty());
}

static void test_mailbox_applies_at_tick_boundary() {
    std::cout << "\n=== TEST: mailbox commands land before the next tick ===\n";

    SimulationConfig cfg = emptyWorldConfig();
    Simulation sim(cfg);
    sim.addDrone(Scenario::makeFriendly("d1", Vec2(0.0, 0.0), cfg));

    std::vector<CommandResult> results;
    sim.setResultCallback([&results](const ControlCommand&, const CommandResult& r) {
        results.push_back(r);
    });

    // Producer on another thread; nothing happens until step().
    std::thread producer([&sim] {
        sim.getMailbox().post(MoveCommand{ { "d1" }, 400.0, 0.0 });
        sim.getMailbox().post(TaskRequest{ "dance", { "d1" }, {} });
    });
    producer.join();

    assert(sim.getWorld().findDrone("d1")->mode == DroneMode::IDLE);
    assert(results.empty());

    sim.step();
    assert(sim.getMailbox().empty());
    assert(results.size() == 2);
    assert(results[0].ok());
    assert(!results[1].ok() && results[1].error == CommandError::UNKNOWN_TASK);

    // Applied before the tick's movement, so the drone already moved once.
    const Drone* d = sim.getWorld().findDrone("d1");
    assert(d->mode == DroneMode::MOVING);
    assert(glm::distance(d->position, Vec2(4.0, 0.0)) < 1e-9);

    // Clock commands through the mailbox take effect on the same boundary.
    sim.getMailbox().post(PauseCommand{ true });
    sim.step();
    assert(sim.getTick() == 1);
    assert(sim.getClockState() == ClockState::PAUSED);

    sim.getMailbox().post(ResetCommand{});
    sim.getMailbox().post(PauseCommand{ false });
    sim.step();
    assert(sim.getTick() == 1 && "reset then one forward tick");
    assert(sim.getWorld().drones.empty());
}

static void test_posted_reset_carries_config() {
    std::cout << "\n=== TEST: parameter changes arrive with a posted reset ===\n";

    Simulation sim(SimulationConfig{});
    std::vector<CommandResult> results;
    sim.setResultCallback([&results](const ControlCommand&, const CommandResult& r) {
        results.push_back(r);
    });
    runTicks(sim, 10);

    SimulationConfig faster;
    faster.friendlySpeed = 300.0;
    sim.getMailbox().post(ResetCommand{ faster });
    sim.getMailbox().post(MoveCommand{ { "drone_1" }, 800.0, 200.0 });
    sim.step();

    assert(results.size() == 2 && results[0].ok() && results[1].ok());
    assert(sim.getTick() == 1);
    assert(sim.getConfig().friendlySpeed == 300.0);
    const Drone* d = sim.getWorld().findDrone("drone_1");
    assert(glm::distance(d->position, Vec2(206.0, 200.0)) < 1e-9);

    // An invalid config is reported and the running world carries on.
    SimulationConfig bad;
    bad.friendlySpeed = 0.0;
    sim.getMailbox().post(ResetCommand{ bad });
    sim.step();

    assert(results.size() == 3);
    assert(!results[2].ok() && results[2].error == CommandError::SCHEMA);
    assert(sim.getTick() == 2);
    assert(sim.getConfig().friendlySpeed == 300.0);
    assert(sim.getHistory().size() == 2);
}

static void test_time_action_parsing() {
    assert(parseTimeAction("reverse") == TimeDirection::REVERSE);
    assert(parseTimeAction("forward") == TimeDirection::FORWARD);
    assert(!parseTimeAction("sideways").has_value());
}

int main() {
    test_default_scenario();
    test_pause_freezes_world();
    test_reverse_then_forward();
    test_runs_are_deterministic();
    test_jump_back();
    test_reset_is_atomic();
    test_mailbox_applies_at_tick_boundary();
    test_posted_reset_carries_config();
    test_time_action_parsing();

    std::cout << "\nAll simulation clock tests passed.\n";
    return 0;
}
