#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "core/Types.h"

// Movement pattern kinds. Enemies are spawned on one; friendly drones pick one
// up through a patrol task.
enum class PatternKind {
    NONE,
    BOUNCE_X,   // oscillate along x between minBound and maxBound
    BOUNCE_Y,   // oscillate along y between minBound and maxBound
    CIRCULAR    // orbit center at radius
};

struct PatternData {
    PatternKind kind = PatternKind::NONE;

    // CIRCULAR
    Vec2 center{ 0.0 };
    double radius = 0.0;
    double angle = 0.0;       // radians, current phase

    // BOUNCE_X / BOUNCE_Y
    double minBound = 0.0;
    double maxBound = 0.0;

    int direction = 1;        // +1 / -1 travel sign (CCW is +1 for CIRCULAR)

    bool operator==(const PatternData& other) const;
    bool operator!=(const PatternData& other) const { return !(*this == other); }
};

// A drone is a plain value: snapshots copy it wholesale, so nothing in here
// may point back into the live world.
struct Drone {
    // ================
    //  Identity
    // ================
    std::string id;
    Team team = Team::FRIENDLY;
    double radius = 10.0;

    // ================
    //  Kinematics
    // ================
    Vec2 position{ 0.0 };
    Vec2 velocity{ 0.0 };

    // ================
    //  Behavior state
    // ================
    DroneMode mode = DroneMode::IDLE;
    std::optional<Vec2> target;
    std::optional<int> groupId;

    std::optional<std::string> tailTargetId;
    double tailDistance = 0.0;

    std::optional<std::string> interceptTargetId;
    std::optional<Vec2> interceptPoint;
    std::optional<double> interceptEta;     // absolute sim time
    int64_t nextInterceptPlanTick = 0;      // retry gate while no solution

    PatternData pattern;
    std::optional<std::string> baseId;

    bool isFriendly() const { return team == Team::FRIENDLY; }
    bool isEnemy() const { return team == Team::ENEMY; }

    // Drop every behavior linkage and stop. Position, identity and base stay.
    void clearTasking();

    bool operator==(const Drone& other) const;
    bool operator!=(const Drone& other) const { return !(*this == other); }
};

Drone makeDrone(const std::string& id, Team team, const Vec2& position, double radius);
