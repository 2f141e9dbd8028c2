#include "control/FormationPattern.h"
#include <cmath>
#include <stdexcept>

FormationPattern::FormationPattern(const std::string& n,
    const std::vector<Vec2>& pts)
    : name(n), slots(pts) {
}

Vec2 FormationPattern::centroid() const {
    if (slots.empty()) return Vec2(0.0);
    Vec2 sum(0.0);
    for (const auto& s : slots) sum += s;
    return sum / static_cast<double>(slots.size());
}

FormationPattern FormationPattern::makeGrid(const std::string& name,
    const Vec2& center,
    int count,
    double spacing) {
    if (count < 0) {
        throw std::invalid_argument("FormationPattern::makeGrid: count must be >= 0");
    }

    std::vector<Vec2> pts;
    if (count == 0) {
        return FormationPattern(name, pts);
    }
    pts.reserve(count);

    const int cols = static_cast<int>(std::ceil(std::sqrt(static_cast<double>(count))));
    const int rows = (count + cols - 1) / cols;

    // Offsets so the grid's bounding box is centered on `center`.
    const double halfW = 0.5 * (cols - 1) * spacing;
    const double halfH = 0.5 * (rows - 1) * spacing;

    for (int i = 0; i < count; ++i) {
        int row = i / cols;
        int col = i % cols;
        pts.emplace_back(center.x - halfW + col * spacing,
            center.y - halfH + row * spacing);
    }

    return FormationPattern(name, pts);
}
