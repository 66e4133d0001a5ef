#pragma once
#include <cstddef>
#include <cstdint>

enum class SolverKind {
    Direct,      // O(n^2) pairwise summation
    BarnesHut    // quadtree approximation
};

const char* to_string(SolverKind kind);

// Defaults match the desktop program: 1280x720 window,
// Coulomb constant, 1e12 kg particles and a 5 unit time step ceiling.
struct SimulationConfig {
    static constexpr size_t MIN_PARTICLES = 1;
    static constexpr size_t MAX_PARTICLES = 100;
    static constexpr int MIN_RADIUS_SCALE = 1;
    static constexpr int MAX_RADIUS_SCALE = 10;

    double world_width;
    double world_height;

    size_t particle_count;
    double particle_radius;
    double particle_mass;

    // Force law: F = coulomb_k * m1 * m2 / (d^2 + softening_eps), capped at max_force
    double coulomb_k;
    double max_force;
    double softening_eps;

    double damping_object;   // particle-particle restitution factor
    double damping_wall;     // wall restitution factor
    double dt_max;

    SolverKind solver;
    double theta;                // Barnes-Hut opening threshold
    size_t leaf_capacity;        // particles per leaf before subdivision
    size_t tree_depth_limit;     // coincident particles stop subdividing here
    bool enable_threading;       // OpenMP over particles in the tree solver (if built with it)

    bool verbose;

    SimulationConfig()
        : world_width(1280.0)
        , world_height(720.0)
        , particle_count(20)
        , particle_radius(5.0)
        , particle_mass(1e12)
        , coulomb_k(8.9875e9)
        , max_force(1e12)
        , softening_eps(1e-7)
        , damping_object(0.99)
        , damping_wall(0.99)
        , dt_max(5.0)
        , solver(SolverKind::Direct)
        , theta(0.8)
        , leaf_capacity(4)
        , tree_depth_limit(16)
        , enable_threading(false)
        , verbose(false)
    {}

    // Throws std::invalid_argument naming the first offending field.
    void validate() const;

    // Menu radius scale 1..10 -> 5, 7, ..., 23
    static double radius_from_scale(int scale);
};
