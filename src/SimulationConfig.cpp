#include "SimulationConfig.h"
#include <cmath>
#include <stdexcept>
#include <string>

const char* to_string(SolverKind kind) {
    switch (kind) {
        case SolverKind::Direct:    return "direct";
        case SolverKind::BarnesHut: return "barnes-hut";
    }
    return "unknown";
}

namespace {

void require(bool condition, const char* field, const std::string& detail) {
    if (!condition) {
        throw std::invalid_argument(std::string("SimulationConfig.") + field + ": " + detail);
    }
}

bool positive_finite(double v) {
    return std::isfinite(v) && v > 0.0;
}

} // namespace

void SimulationConfig::validate() const {
    require(positive_finite(world_width), "world_width", "must be a positive finite number");
    require(positive_finite(world_height), "world_height", "must be a positive finite number");

    require(particle_count >= MIN_PARTICLES && particle_count <= MAX_PARTICLES, "particle_count",
            "must be within [" + std::to_string(MIN_PARTICLES) + ", " + std::to_string(MAX_PARTICLES) + "]");
    require(positive_finite(particle_radius), "particle_radius", "must be a positive finite number");
    require(2.0 * particle_radius <= world_width && 2.0 * particle_radius <= world_height,
            "particle_radius", "particle does not fit inside the world");
    require(positive_finite(particle_mass), "particle_mass", "must be a positive finite number");

    require(positive_finite(coulomb_k), "coulomb_k", "must be a positive finite number");
    require(positive_finite(max_force), "max_force", "must be a positive finite number");
    require(positive_finite(softening_eps), "softening_eps", "must be a positive finite number");

    require(damping_object > 0.0 && damping_object <= 1.0, "damping_object", "must be within (0, 1]");
    require(damping_wall > 0.0 && damping_wall <= 1.0, "damping_wall", "must be within (0, 1]");
    require(positive_finite(dt_max), "dt_max", "must be a positive finite number");

    require(theta > 0.0 && theta <= 1.0, "theta", "must be within (0, 1]");
    require(leaf_capacity >= 1, "leaf_capacity", "must be at least 1");
    require(tree_depth_limit >= 1 && tree_depth_limit <= 64, "tree_depth_limit", "must be within [1, 64]");
}

double SimulationConfig::radius_from_scale(int scale) {
    if (scale < MIN_RADIUS_SCALE || scale > MAX_RADIUS_SCALE) {
        throw std::invalid_argument("radius scale must be within [1, 10], got " + std::to_string(scale));
    }
    return 5.0 + 2.0 * (scale - 1);
}
