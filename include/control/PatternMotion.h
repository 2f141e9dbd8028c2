#pragma once
#include "core/Drone.h"

// Closed-form motion along a PatternData. Both the per-tick follower and the
// intercept planner go through advance(), so a prediction made now matches
// the positions the follower will actually produce.
namespace PatternMotion {

    struct PatternState {
        Vec2 position;
        PatternData pattern;   // phase / direction after the advance
    };

    // Advance a drone at `position` along `pattern` by `elapsed` seconds at
    // `speed`. Bounce patterns reflect instantaneously at each bound; the
    // off-axis coordinate is kept from `position`.
    PatternState advance(const PatternData& pattern,
        const Vec2& position,
        double speed,
        double elapsed);

    // Where `drone` will be `elapsed` seconds from now. Patterned drones use
    // advance(); anything else is extrapolated along its current velocity.
    Vec2 predict(const Drone& drone, double speed, double elapsed);

    // Point at which a drone at `position` should join `pattern`.
    Vec2 entryPoint(const PatternData& pattern, const Vec2& position);

    // Phase/direction for a drone starting the pattern at `position`.
    PatternData alignTo(const PatternData& pattern, const Vec2& position);

    // Convenience builders.
    PatternData makeBounce(PatternKind axis, double minBound, double maxBound, int direction);
    PatternData makeCircle(const Vec2& center, double radius, double angle, int direction);

} // namespace PatternMotion
