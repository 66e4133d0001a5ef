#include "ForceSolver.h"
#include "ParticleSystem.h"
#include <algorithm>
#include <cmath>

#ifdef _OPENMP
#include <omp.h>
#endif

//===========================================================================================
//==                                  DIRECT SUMMATION                                     ==
//===========================================================================================

void DirectForceSolver::solve(ParticleSystem& particles) {
    const size_t N = particles.get_particle_count();
    const double* const px = particles.get_positions_x().data();
    const double* const py = particles.get_positions_y().data();
    const double* const m  = particles.get_masses().data();
    const double* const r  = particles.get_radii().data();
    double* const fx = particles.forces_x().data();
    double* const fy = particles.forces_y().data();

    for (size_t i = 0; i + 1 < N; ++i) {
        for (size_t j = i + 1; j < N; ++j) {
            double f_x = 0.0, f_y = 0.0;
            if (!pair_force(px[j] - px[i], py[j] - py[i], m[i], m[j], r[i] + r[j], law_, f_x, f_y)) {
                continue;
            }
            fx[i] += f_x;
            fy[i] += f_y;
            fx[j] -= f_x;
            fy[j] -= f_y;
        }
    }
}

//===========================================================================================
//==                                   BARNES-HUT                                          ==
//===========================================================================================

BarnesHutForceSolver::BarnesHutForceSolver(const ForceLaw& law, const geom::AABBd& world, const Config& config)
    : law_(law), world_(world), config_(config),
      tree_(config.leaf_capacity, config.tree_depth_limit) {}

void BarnesHutForceSolver::solve(ParticleSystem& particles) {
    stats_ = TraversalStats{};
    const size_t N = particles.get_particle_count();
    if (N == 0) {
        tree_.clear();
        return;
    }

    tree_.build(particles, geom::covering_square(world_));
    const uint32_t root = tree_.root();

    double* const forces_x = particles.forces_x().data();
    double* const forces_y = particles.forces_y().data();

    size_t nodes_visited = 0, leaf_pairs = 0, approximations = 0, degenerate_skips = 0;

    #ifdef _OPENMP
    if (config_.enable_threading) {
        #pragma omp parallel for schedule(static) reduction(+:nodes_visited, leaf_pairs, approximations, degenerate_skips)
        for (long long i = 0; i < (long long)N; ++i) {
            double fx = 0.0, fy = 0.0;
            TraversalStats local;
            calculate_force_on_particle(root, (size_t)i, particles, fx, fy, local);
            forces_x[(size_t)i] += fx;
            forces_y[(size_t)i] += fy;
            nodes_visited += local.nodes_visited;
            leaf_pairs += local.leaf_pairs;
            approximations += local.approximations;
            degenerate_skips += local.degenerate_skips;
        }
        stats_ = TraversalStats{nodes_visited, leaf_pairs, approximations, degenerate_skips};
        return;
    }
    #endif

    for (size_t i = 0; i < N; ++i) {
        double fx = 0.0, fy = 0.0;
        calculate_force_on_particle(root, i, particles, fx, fy, stats_);
        forces_x[i] += fx;
        forces_y[i] += fy;
    }
}

void BarnesHutForceSolver::calculate_force_on_particle(uint32_t node_index, size_t i,
                                                       const ParticleSystem& particles,
                                                       double& fx, double& fy,
                                                       TraversalStats& stats) const {
    const QuadTree::Node& node = tree_.node(node_index);
    ++stats.nodes_visited;

    const double px = particles.get_positions_x()[i];
    const double py = particles.get_positions_y()[i];
    const double mi = particles.get_masses()[i];

    if (node.is_leaf) {
        const double ri = particles.get_radii()[i];
        for (uint32_t j : node.particles) {
            if (j == i) continue;
            double f_x = 0.0, f_y = 0.0;
            if (pair_force(particles.get_positions_x()[j] - px, particles.get_positions_y()[j] - py,
                           mi, particles.get_masses()[j], ri + particles.get_radii()[j],
                           law_, f_x, f_y)) {
                fx += f_x;
                fy += f_y;
            }
            ++stats.leaf_pairs;
        }
        return;
    }

    const double dx = node.com_x - px;
    const double dy = node.com_y - py;
    const double dist = std::sqrt(dx * dx + dy * dy + law_.softening_eps);

    // Centre of mass on top of the particle: no usable direction
    if (dist < 1.0) {
        ++stats.degenerate_skips;
        return;
    }

    if (node.size / dist < config_.theta) {
        double f_x = 0.0, f_y = 0.0;
        pair_force(dx, dy, mi, node.total_mass, 0.0, law_, f_x, f_y);
        fx += f_x;
        fy += f_y;
        ++stats.approximations;
        return;
    }

    for (uint32_t child : node.children) {
        calculate_force_on_particle(child, i, particles, fx, fy, stats);
    }
}

std::unique_ptr<ForceSolver> make_force_solver(SolverKind kind, const SimulationConfig& config) {
    const ForceLaw law = ForceLaw::from_config(config);
    switch (kind) {
        case SolverKind::Direct:
            return std::make_unique<DirectForceSolver>(law);
        case SolverKind::BarnesHut: {
            BarnesHutForceSolver::Config bh;
            bh.theta = config.theta;
            bh.leaf_capacity = config.leaf_capacity;
            bh.tree_depth_limit = config.tree_depth_limit;
            bh.enable_threading = config.enable_threading;
            const geom::AABBd world{0.0, 0.0, config.world_width, config.world_height};
            return std::make_unique<BarnesHutForceSolver>(law, world, bh);
        }
    }
    return nullptr;
}
