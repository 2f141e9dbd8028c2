#include "control/AssignmentStrategy.h"
#include <algorithm>

namespace AssignmentStrategy {

    std::vector<DroneAssignment>
        assignDronesToPattern(const std::vector<std::string>& droneIds,
            const FormationPattern& pattern)
    {
        std::vector<DroneAssignment> out;
        if (droneIds.empty() || pattern.empty()) {
            return out;
        }

        // Make a copy so we can ensure deterministic ordering.
        std::vector<std::string> ids = droneIds;
        std::sort(ids.begin(), ids.end());

        const int N = std::min(static_cast<int>(ids.size()), pattern.size());
        out.reserve(N);

        for (int i = 0; i < N; ++i) {
            out.push_back(DroneAssignment{ ids[i], pattern.slots[i], i });
        }

        return out;
    }

} // namespace AssignmentStrategy
