#include "core/Drone.h"

bool PatternData::operator==(const PatternData& other) const {
    return kind == other.kind
        && center == other.center
        && radius == other.radius
        && angle == other.angle
        && minBound == other.minBound
        && maxBound == other.maxBound
        && direction == other.direction;
}

void Drone::clearTasking() {
    velocity = Vec2(0.0);
    mode = DroneMode::IDLE;
    target.reset();
    groupId.reset();
    tailTargetId.reset();
    tailDistance = 0.0;
    interceptTargetId.reset();
    interceptPoint.reset();
    interceptEta.reset();
    nextInterceptPlanTick = 0;
    pattern = PatternData{};
}

bool Drone::operator==(const Drone& other) const {
    return id == other.id
        && team == other.team
        && radius == other.radius
        && position == other.position
        && velocity == other.velocity
        && mode == other.mode
        && target == other.target
        && groupId == other.groupId
        && tailTargetId == other.tailTargetId
        && tailDistance == other.tailDistance
        && interceptTargetId == other.interceptTargetId
        && interceptPoint == other.interceptPoint
        && interceptEta == other.interceptEta
        && nextInterceptPlanTick == other.nextInterceptPlanTick
        && pattern == other.pattern
        && baseId == other.baseId;
}

Drone makeDrone(const std::string& id, Team team, const Vec2& position, double radius) {
    Drone d;
    d.id = id;
    d.team = team;
    d.position = position;
    d.radius = radius;
    return d;
}
