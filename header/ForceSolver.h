#pragma once
#include "Bounds.hpp"
#include "QuadTree.h"
#include "SimulationConfig.h"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <memory>

class ParticleSystem;

struct ForceLaw {
    double coulomb_k;
    double max_force;
    double softening_eps;

    static ForceLaw from_config(const SimulationConfig& config) {
        return ForceLaw{config.coulomb_k, config.max_force, config.softening_eps};
    }
};

// Force exerted on a body at the origin of (dx, dy) by a mass at (dx, dy).
// The vector points towards the other mass. Returns false without touching
// fx/fy when the two discs overlap (contact = reach > 0 and dist < reach);
// collision handling owns that case.
inline bool pair_force(double dx, double dy, double mi, double mj, double reach,
                       const ForceLaw& law, double& fx, double& fy) {
    const double dist_sq = dx * dx + dy * dy + law.softening_eps;
    const double dist = std::sqrt(dist_sq);
    if (dist < reach) return false;

    const double magnitude = std::min(law.coulomb_k * mi * mj / dist_sq, law.max_force);
    fx = magnitude * dx / dist;
    fy = magnitude * dy / dist;
    return true;
}

// Accumulates the net field force of every particle into its fx/fy.
// Forces are additive: two solve() calls without an integration in between
// double-count.
class ForceSolver {
public:
    virtual ~ForceSolver() = default;
    virtual void solve(ParticleSystem& particles) = 0;
    virtual const char* name() const = 0;
    virtual SolverKind kind() const = 0;
};

class DirectForceSolver : public ForceSolver {
public:
    explicit DirectForceSolver(const ForceLaw& law) : law_(law) {}

    void solve(ParticleSystem& particles) override;
    const char* name() const override { return "direct"; }
    SolverKind kind() const override { return SolverKind::Direct; }

private:
    ForceLaw law_;
};

class BarnesHutForceSolver : public ForceSolver {
public:
    struct Config {
        double theta;
        size_t leaf_capacity;
        size_t tree_depth_limit;
        bool enable_threading;

        Config()
            : theta(0.8)
            , leaf_capacity(QuadTree::DEFAULT_LEAF_CAPACITY)
            , tree_depth_limit(QuadTree::DEFAULT_DEPTH_LIMIT)
            , enable_threading(false)
        {}
    };

    // Per-solve traversal counters
    struct TraversalStats {
        size_t nodes_visited = 0;
        size_t leaf_pairs = 0;
        size_t approximations = 0;
        size_t degenerate_skips = 0;
    };

    BarnesHutForceSolver(const ForceLaw& law, const geom::AABBd& world, const Config& config = Config{});

    void solve(ParticleSystem& particles) override;
    const char* name() const override { return "barnes-hut"; }
    SolverKind kind() const override { return SolverKind::BarnesHut; }

    void set_theta(double theta) { config_.theta = theta; }
    double theta() const { return config_.theta; }
    const Config& get_config() const { return config_; }

    // Tree of the most recent solve()
    const QuadTree& tree() const { return tree_; }
    const TraversalStats& last_stats() const { return stats_; }

private:
    #ifdef CB_TESTING
        friend struct CBTestHooks;
    #endif

    void calculate_force_on_particle(uint32_t node_index, size_t i,
                                     const ParticleSystem& particles,
                                     double& fx, double& fy,
                                     TraversalStats& stats) const;

    ForceLaw law_;
    geom::AABBd world_;
    Config config_;
    QuadTree tree_;
    TraversalStats stats_;
};

std::unique_ptr<ForceSolver> make_force_solver(SolverKind kind, const SimulationConfig& config);
