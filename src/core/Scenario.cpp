#include "core/Scenario.h"
#include "control/FormationPattern.h"
#include "control/PatternMotion.h"

namespace Scenario {

    Drone makeFriendly(const std::string& id, const Vec2& pos, const SimulationConfig& cfg) {
        return makeDrone(id, Team::FRIENDLY, pos, cfg.droneRadius);
    }

    Drone makeEnemy(const std::string& id, const Vec2& pos, const PatternData& pattern,
        const SimulationConfig& cfg)
    {
        Drone d = makeDrone(id, Team::ENEMY, pos, cfg.droneRadius);
        d.pattern = PatternMotion::alignTo(pattern, pos);
        d.mode = DroneMode::PATROLLING;
        return d;
    }

    void populateDefaultWorld(WorldState& world, const SimulationConfig& cfg) {
        // Bases
        const Base bases[] = {
            { "base_alpha",   Vec2(100.0, 100.0), BaseShape::SQUARE,   "Alpha" },
            { "base_bravo",   Vec2(900.0, 100.0), BaseShape::CIRCLE,   "Bravo" },
            { "base_charlie", Vec2(500.0, 900.0), BaseShape::TRIANGLE, "Charlie" },
        };
        for (const auto& b : bases) {
            world.bases[b.id] = b;
        }

        // Friendly block: 12 drones, 4 columns, 80 units apart, top-left (200, 200).
        const int numFriendly = 12;
        const double spacing = 80.0;
        FormationPattern block = FormationPattern::makeGrid("spawn",
            Vec2(200.0 + 1.5 * spacing, 200.0 + 1.0 * spacing),
            numFriendly, spacing);

        for (int i = 0; i < block.size(); ++i) {
            Drone d = makeFriendly("drone_" + std::to_string(i + 1), block.slots[i], cfg);
            if (const Base* home = world.nearestBase(d.position)) {
                d.baseId = home->id;
            }
            world.drones[d.id] = d;
        }

        // Enemies, one per pattern kind.
        Drone e1 = makeEnemy("enemy_1", Vec2(100.0, 700.0),
            PatternMotion::makeBounce(PatternKind::BOUNCE_X, 100.0, 900.0, 1), cfg);
        Drone e2 = makeEnemy("enemy_2", Vec2(850.0, 500.0),
            PatternMotion::makeBounce(PatternKind::BOUNCE_Y, 500.0, 950.0, 1), cfg);
        Drone e3 = makeEnemy("enemy_3", Vec2(770.0, 300.0),
            PatternMotion::makeCircle(Vec2(650.0, 300.0), 120.0, 0.0, 1), cfg);

        for (const auto& e : { e1, e2, e3 }) {
            world.drones[e.id] = e;
        }
    }

} // namespace Scenario
