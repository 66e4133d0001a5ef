#pragma once
#include <cmath>

// Plain value type for the public API; solver internals use Eigen where it helps
struct Vec2 {
    double x, y;
    
    Vec2() : x(0), y(0) {}
    Vec2(double x, double y) : x(x), y(y) {}
    
    Vec2 operator-(const Vec2& other) const { return Vec2(x - other.x, y - other.y); }
    
    double length() const { return std::sqrt(x*x + y*y); }
    
    // Closed-interval test, used for the containment invariant
    bool is_within_bounds(double min_x, double max_x, double min_y, double max_y) const {
        return x >= min_x && x <= max_x && y >= min_y && y <= max_y;
    }
};
