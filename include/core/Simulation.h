#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "command/CommandMailbox.h"
#include "command/Commands.h"
#include "command/Task.h"
#include "config/SimulationConfig.h"
#include "control/CollisionResolver.h"
#include "control/FormationCoordinator.h"
#include "control/InterceptPlanner.h"
#include "control/MovementController.h"
#include "control/PatternFollower.h"
#include "control/TailController.h"
#include "core/HistoryBuffer.h"
#include "core/WorldState.h"

// Read-only copies handed out by queryWorld(); nothing in here aliases the
// live world.
struct DroneView {
    std::string id;
    Team team;
    Vec2 position;
    Vec2 velocity;
    DroneMode mode;
    std::optional<Vec2> target;
    std::optional<std::string> baseId;
};

struct WorldView {
    int64_t tick = 0;
    double time = 0.0;
    ClockState clock = ClockState::RUNNING_FORWARD;
    std::vector<DroneView> drones;
    std::vector<Base> bases;
    std::size_t historySize = 0;
};

// Owns the world and runs the fixed-step clock.
//
// Single writer: step() and the boundary operations below must be called
// from one thread. Other threads post to getMailbox(); the mailbox is drained
// at the start of each step(), before any tick work.
class Simulation {
public:
    explicit Simulation(const SimulationConfig& config);

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    // Clear drones, bases, groups and history together and rebuild the
    // initial world. Throws std::invalid_argument for an unusable config, in
    // which case nothing is changed.
    void reset();
    void reset(const SimulationConfig& config);

    void addDrone(const Drone& drone);
    void addBase(const Base& base);

    // One fixed-timestep tick: drain the mailbox, then run forward physics,
    // a reverse-playback step, or nothing, depending on the clock state.
    void step();

    // ---- Boundary operations -------------------------------------------
    WorldView queryWorld() const;

    CommandResult issueMove(const MoveCommand& cmd);
    CommandResult issueTask(const TaskRequest& request);
    CommandResult setBase(const SetBaseCommand& cmd);
    CommandResult setPaused(bool paused);
    CommandResult setTimeDirection(TimeDirection direction);
    CommandResult jumpBack();

    // Dispatch any boundary command.
    CommandResult apply(const ControlCommand& command);

    CommandMailbox& getMailbox() { return mailbox; }

    // Optional callback for results of mailbox commands.
    void setResultCallback(std::function<void(const ControlCommand&, const CommandResult&)> callback) {
        resultCallback = callback;
    }

    // ---- Accessors -----------------------------------------------------
    const WorldState& getWorld() const { return world; }
    WorldState& getWorld() { return world; }
    const HistoryBuffer& getHistory() const { return history; }
    const InterceptPlanner& getInterceptPlanner() const { return intercept; }
    const std::vector<CollisionEvent>& getLastCollisions() const { return lastCollisions; }

    ClockState getClockState() const { return world.clockState(); }
    int64_t getTick() const { return world.tick; }
    double getTime() const;

    const SimulationConfig& getConfig() const { return cfg; }

private:
    SimulationConfig cfg;
    WorldState world;
    HistoryBuffer history;

    MovementController movement;
    InterceptPlanner intercept;
    TailController tail;
    PatternFollower patterns;
    FormationCoordinator formation;

    CommandMailbox mailbox;
    std::function<void(const ControlCommand&, const CommandResult&)> resultCallback;

    std::vector<CollisionEvent> lastCollisions;

    void stepForward();
    void stepReverse();
    void applyMailbox();

    CommandResult assignTask(const Task& task, const std::vector<std::string>& droneIds);
};
