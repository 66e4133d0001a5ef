#pragma once
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "ForceSolver.h"
#include "ParticleSystem.h"
#include "EventSystem.h"
#include "Bounds.hpp"
#include "VersionedPipelineTestKit.hpp"

// Force evaluation as a pipeline: particle configuration in, per-particle
// net force out.
struct ForceSpec {
    struct Input {
        std::vector<double> x, y, m, r;
        geom::AABBd world;
        ForceLaw law;
    };

    struct State {
        EventBus bus;
        std::unique_ptr<ParticleSystem> ps;
        Input input;
    };

    struct Output {
        std::vector<double> fx, fy;

        bool operator==(const Output& o) const {
            return fx == o.fx && fy == o.fy;
        }
    };

    enum class Dist { Uniform, Clustered, Line };

    static Input gen_input(std::size_t n, unsigned seed) {
        return gen_input_dist(n, seed, Dist::Uniform);
    }

    static Input gen_input_dist(std::size_t n, unsigned seed, Dist d) {
        Input in;
        in.world = geom::AABBd{0.0, 0.0, 800.0, 600.0};
        in.law = ForceLaw{1.0, 1e30, 1e-7};
        in.x.resize(n);
        in.y.resize(n);
        in.m.resize(n);
        in.r.assign(n, 1.0);

        std::mt19937 rng(seed);
        std::uniform_real_distribution<double> ux(10.0, 790.0);
        std::uniform_real_distribution<double> uy(10.0, 590.0);
        std::uniform_real_distribution<double> um(0.5, 2.0);
        std::normal_distribution<double> blob(0.0, 25.0);

        const double cx = ux(rng), cy = uy(rng);
        for (std::size_t i = 0; i < n; ++i) {
            switch (d) {
                case Dist::Uniform:
                    in.x[i] = ux(rng);
                    in.y[i] = uy(rng);
                    break;
                case Dist::Clustered:
                    in.x[i] = std::clamp(cx + blob(rng), 1.0, 799.0);
                    in.y[i] = std::clamp(cy + blob(rng), 1.0, 599.0);
                    break;
                case Dist::Line:
                    in.x[i] = 20.0 + (760.0 * i) / std::max<std::size_t>(1, n);
                    in.y[i] = 300.0;
                    break;
            }
            in.m[i] = um(rng);
        }
        return in;
    }

    static void load_particles(State& state, const Input& in) {
        state.input = in;
        state.ps = std::make_unique<ParticleSystem>(in.x.size(), state.bus);
        for (std::size_t i = 0; i < in.x.size(); ++i) {
            state.ps->add_particle({in.x[i], in.y[i]}, {0.0, 0.0}, in.m[i], in.r[i]);
        }
    }

    static Output collect(const ParticleSystem& ps) {
        Output out;
        const std::size_t N = ps.get_particle_count();
        out.fx.assign(ps.get_forces_x().begin(), ps.get_forces_x().begin() + N);
        out.fy.assign(ps.get_forces_y().begin(), ps.get_forces_y().begin() + N);
        return out;
    }

    static void check_invariants(const Input& in, const Output& out) {
        const std::size_t N = in.x.size();
        if (out.fx.size() != N || out.fy.size() != N) {
            throw std::runtime_error("force arrays do not match particle count");
        }
        for (std::size_t i = 0; i < N; ++i) {
            if (!std::isfinite(out.fx[i]) || !std::isfinite(out.fy[i])) {
                throw std::runtime_error("non-finite force on particle " + std::to_string(i));
            }
            if (std::hypot(out.fx[i], out.fy[i]) > in.law.max_force * static_cast<double>(N)) {
                throw std::runtime_error("force exceeds N * max_force on particle " + std::to_string(i));
            }
        }
    }

    // Largest per-particle error relative to the reference magnitude
    static double max_rel_err(const Output& approx, const Output& ref) {
        double e = 0.0;
        for (std::size_t i = 0; i < ref.fx.size(); ++i) {
            double nb = std::hypot(ref.fx[i], ref.fy[i]);
            if (nb < 1e-12) nb = 1.0;
            e = std::max(e, std::hypot(approx.fx[i] - ref.fx[i], approx.fy[i] - ref.fy[i]) / nb);
        }
        return e;
    }
};
static_assert(VersionedPipelineTestKit::PipelineSpec<ForceSpec>);

struct DirectForceSystem {
    static std::string_view name() { return "direct"; }

    static void load(ForceSpec::State& state, const ForceSpec::Input& in) {
        ForceSpec::load_particles(state, in);
    }

    static ForceSpec::Output execute(ForceSpec::State& state) {
        DirectForceSolver solver(state.input.law);
        solver.solve(*state.ps);
        return ForceSpec::collect(*state.ps);
    }
};

// Barnes-Hut at a fixed opening threshold, theta = ThetaMilli / 1000
template<int ThetaMilli>
struct BarnesHutForceSystem {
    static std::string_view name() {
        static const std::string n = "barnes-hut(theta=" + std::to_string(ThetaMilli / 1000.0) + ")";
        return n;
    }

    static void load(ForceSpec::State& state, const ForceSpec::Input& in) {
        ForceSpec::load_particles(state, in);
    }

    static ForceSpec::Output execute(ForceSpec::State& state) {
        BarnesHutForceSolver::Config cfg;
        cfg.theta = ThetaMilli / 1000.0;
        BarnesHutForceSolver solver(state.input.law, state.input.world, cfg);
        solver.solve(*state.ps);
        return ForceSpec::collect(*state.ps);
    }
};

using DirectVersion = VersionedPipelineTestKit::VersionFromSystem<ForceSpec, DirectForceSystem>;
using TightBarnesHutVersion = VersionedPipelineTestKit::VersionFromSystem<ForceSpec, BarnesHutForceSystem<10>>;
using DefaultBarnesHutVersion = VersionedPipelineTestKit::VersionFromSystem<ForceSpec, BarnesHutForceSystem<800>>;
using CoarseBarnesHutVersion = VersionedPipelineTestKit::VersionFromSystem<ForceSpec, BarnesHutForceSystem<1000>>;

static_assert(VersionedPipelineTestKit::VersionFor<DirectVersion, ForceSpec>);
static_assert(VersionedPipelineTestKit::VersionFor<TightBarnesHutVersion, ForceSpec>);
