#include "control/PatternMotion.h"

#include <algorithm>
#include <cmath>

namespace PatternMotion {

    namespace {

        const double TWO_PI = 6.283185307179586;

        double wrapAngle(double a) {
            a = std::fmod(a, TWO_PI);
            if (a < 0.0) a += TWO_PI;
            return a;
        }

        // Bounce motion unfolded onto a loop of length 2L: the first half is
        // the outbound leg (+1), the second half the way back (-1).
        void advanceBounce(double& coord, int& direction,
            double minBound, double maxBound, double distance)
        {
            double span = maxBound - minBound;
            if (span <= 0.0) {
                coord = minBound;
                return;
            }

            double offset = std::clamp(coord, minBound, maxBound) - minBound;
            double loop = 2.0 * span;
            double s = (direction >= 0) ? offset : loop - offset;

            s = std::fmod(s + distance, loop);
            if (s < 0.0) s += loop;

            if (s <= span) {
                coord = minBound + s;
                direction = 1;
            }
            else {
                coord = minBound + (loop - s);
                direction = -1;
            }
        }

    } // anonymous namespace

    PatternState advance(const PatternData& pattern,
        const Vec2& position,
        double speed,
        double elapsed)
    {
        PatternState out{ position, pattern };
        double distance = speed * elapsed;

        switch (pattern.kind) {
        case PatternKind::BOUNCE_X:
            advanceBounce(out.position.x, out.pattern.direction,
                pattern.minBound, pattern.maxBound, distance);
            break;

        case PatternKind::BOUNCE_Y:
            advanceBounce(out.position.y, out.pattern.direction,
                pattern.minBound, pattern.maxBound, distance);
            break;

        case PatternKind::CIRCULAR:
            if (pattern.radius <= 0.0) {
                out.position = pattern.center;
                break;
            }
            {
                double rate = speed / pattern.radius;   // angular rate
                double sign = (pattern.direction >= 0) ? 1.0 : -1.0;
                out.pattern.angle = wrapAngle(pattern.angle + sign * rate * elapsed);
                out.position = pattern.center + pattern.radius *
                    Vec2(std::cos(out.pattern.angle), std::sin(out.pattern.angle));
            }
            break;

        case PatternKind::NONE:
            break;
        }

        return out;
    }

    Vec2 predict(const Drone& drone, double speed, double elapsed) {
        bool onPattern = drone.mode == DroneMode::PATROLLING
            && drone.pattern.kind != PatternKind::NONE
            && !drone.target;
        if (onPattern) {
            return advance(drone.pattern, drone.position, speed, elapsed).position;
        }
        return drone.position + drone.velocity * elapsed;
    }

    Vec2 entryPoint(const PatternData& pattern, const Vec2& position) {
        switch (pattern.kind) {
        case PatternKind::BOUNCE_X:
            return Vec2(std::clamp(position.x, pattern.minBound, pattern.maxBound), position.y);

        case PatternKind::BOUNCE_Y:
            return Vec2(position.x, std::clamp(position.y, pattern.minBound, pattern.maxBound));

        case PatternKind::CIRCULAR: {
            Vec2 offset = position - pattern.center;
            double len = glm::length(offset);
            if (len < 1e-9) {
                return pattern.center + Vec2(pattern.radius, 0.0);
            }
            return pattern.center + offset * (pattern.radius / len);
        }

        case PatternKind::NONE:
            break;
        }
        return position;
    }

    PatternData alignTo(const PatternData& pattern, const Vec2& position) {
        PatternData aligned = pattern;
        if (pattern.kind == PatternKind::CIRCULAR) {
            Vec2 offset = entryPoint(pattern, position) - pattern.center;
            aligned.angle = wrapAngle(std::atan2(offset.y, offset.x));
        }
        return aligned;
    }

    PatternData makeBounce(PatternKind axis, double minBound, double maxBound, int direction) {
        PatternData p;
        p.kind = axis;
        p.minBound = minBound;
        p.maxBound = maxBound;
        p.direction = (direction >= 0) ? 1 : -1;
        return p;
    }

    PatternData makeCircle(const Vec2& center, double radius, double angle, int direction) {
        PatternData p;
        p.kind = PatternKind::CIRCULAR;
        p.center = center;
        p.radius = radius;
        p.angle = wrapAngle(angle);
        p.direction = (direction >= 0) ? 1 : -1;
        return p;
    }

} // namespace PatternMotion
