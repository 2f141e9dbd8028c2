#pragma once
#include <string>
#include <vector>

#include "core/Types.h"

// An ordered set of formation slots on the world plane. Slot order is the
// assignment order: slot i goes to the i-th drone by id.
class FormationPattern {
public:
    std::string name;
    std::vector<Vec2> slots;

    FormationPattern() = default;
    FormationPattern(const std::string& n, const std::vector<Vec2>& pts);

    bool empty() const { return slots.empty(); }
    int size() const { return static_cast<int>(slots.size()); }

    // Axis-aligned centroid of the slots.
    Vec2 centroid() const;

    // --- Built-in layouts ---

    // Square-ish grid for `count` drones centered on `center`:
    // cols = ceil(sqrt(count)), rows = ceil(count / cols), filled row by row.
    static FormationPattern makeGrid(const std::string& name,
        const Vec2& center,
        int count,
        double spacing);

};
