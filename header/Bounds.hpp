#pragma once
#include <algorithm>

namespace geom {

struct AABBd {
    double min_x, min_y, max_x, max_y;
    double width()  const noexcept { return max_x - min_x; }
    double height() const noexcept { return max_y - min_y; }
};

// Square cell of the quadtree. Membership is half-open on both axes so that
// a point on a shared edge belongs to exactly one sibling.
struct Square {
    double min_x, min_y, size;

    bool contains(double x, double y) const noexcept {
        return x >= min_x && x < min_x + size &&
               y >= min_y && y < min_y + size;
    }

    double center_x() const noexcept { return min_x + 0.5 * size; }
    double center_y() const noexcept { return min_y + 0.5 * size; }

    // SW(0) SE(1) NW(2) NE(3)
    Square quadrant(int quad) const noexcept {
        const double half = 0.5 * size;
        const double qx = (quad & 1) ? min_x + half : min_x;
        const double qy = (quad & 2) ? min_y + half : min_y;
        return Square{qx, qy, half};
    }
};

// Smallest square anchored at the box origin that covers the whole box
inline Square covering_square(const AABBd& box) noexcept {
    return Square{box.min_x, box.min_y, std::max(box.width(), box.height())};
}

} // namespace geom
