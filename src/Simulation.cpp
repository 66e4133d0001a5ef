#include "Simulation.h"
#include "Integrator.h"
#include "ParticleFactory.h"
#include <iostream>

namespace {

CollisionResolver::Config collision_config(const SimulationConfig& config) {
    CollisionResolver::Config c;
    c.world_width = config.world_width;
    c.world_height = config.world_height;
    c.damping_object = config.damping_object;
    c.damping_wall = config.damping_wall;
    return c;
}

} // namespace

const SimulationConfig& Simulation::validated(const SimulationConfig& config) {
    config.validate();
    return config;
}

Simulation::Simulation(const SimulationConfig& config, EventBus& event_bus)
    : config_(validated(config)),
      event_bus_(event_bus),
      particles_(SimulationConfig::MAX_PARTICLES, event_bus),
      solver_(make_force_solver(config.solver, config)),
      collisions_(collision_config(config)),
      paused_(false),
      iteration_count_(0) {

    if (config_.verbose) {
        std::cout << "Simulation initialized: " << config_.world_width << "x" << config_.world_height
                  << " world, " << to_string(config_.solver) << " solver, dt_max " << config_.dt_max << "\n";
    }
}

Simulation::~Simulation() = default;

TickReport Simulation::update() {
    if (paused_) {
        return TickReport{0.0, 0, 0, iteration_count_, false};
    }
    const double dt = compute_adaptive_time_step(particles_, config_.dt_max, config_.softening_eps);
    return step(dt);
}

TickReport Simulation::step(double dt) {
    TickReport report{dt, 0, 0, iteration_count_, true};
    if (particles_.get_particle_count() == 0) {
        return report;
    }

    // Each phase completes for every particle before the next one starts
    solver_->solve(particles_);
    integrate_semi_implicit_euler(particles_, dt);
    report.particle_contacts = collisions_.resolve_particle_collisions(particles_);
    report.wall_contacts = collisions_.resolve_wall_collisions(particles_);
    collisions_.clamp_to_bounds(particles_);

    iteration_count_++;
    report.tick = iteration_count_;

    emit_tick_events(report);
    return report;
}

void Simulation::emit_tick_events(const TickReport& report) {
    particles_.prepare_render_data();

    PhysicsUpdateEvent physics_event{
        report.dt,
        particles_.get_particle_count(),
        iteration_count_,
        report.particle_contacts,
        report.wall_contacts
    };
    event_bus_.emit(Events::PHYSICS_UPDATE, physics_event);

    RenderUpdateEvent render_event{
        particles_.get_render_positions().data(),
        particles_.get_radii().data(),
        particles_.get_render_speeds().data(),
        particles_.get_particle_count(),
        config_.world_width,
        config_.world_height
    };
    event_bus_.emit(Events::RENDER_UPDATE, render_event);
}

void Simulation::reset(uint32_t seed) {
    particles_.clear_particles();
    iteration_count_ = 0;

    ParticleFactory factory(particles_);
    const geom::AABBd world{0.0, 0.0, config_.world_width, config_.world_height};
    const size_t added = factory.add_uniform(config_.particle_count, config_.particle_radius,
                                             config_.particle_mass, world, seed);
    if (added != config_.particle_count) {
        std::cerr << "Simulation::reset: requested " << config_.particle_count
                  << " particles, store accepted " << added << "\n";
    }
    if (config_.verbose) {
        std::cout << "Simulation reset with " << added << " particles (seed " << seed << ")\n";
    }

    SimulationResetEvent event{added, seed};
    event_bus_.emit(Events::SIMULATION_RESET, event);
}

void Simulation::set_solver(SolverKind kind) {
    if (solver_ && solver_->kind() == kind) return;
    solver_ = make_force_solver(kind, config_);
    config_.solver = kind;
    if (config_.verbose) {
        std::cout << "Force solver switched to " << solver_->name() << "\n";
    }
}

void Simulation::pause() {
    if (paused_) return;
    paused_ = true;
    event_bus_.emit(Events::SIMULATION_PAUSED, SimulationPausedEvent{true});
}

void Simulation::resume() {
    if (!paused_) return;
    paused_ = false;
    event_bus_.emit(Events::SIMULATION_PAUSED, SimulationPausedEvent{false});
}

void Simulation::toggle_pause() {
    if (paused_) resume();
    else pause();
}

std::optional<size_t> Simulation::pick_particle(double x, double y) const {
    const size_t N = particles_.get_particle_count();
    for (size_t i = 0; i < N; ++i) {
        const Vec2 offset = particles_.get_position(i) - Vec2(x, y);
        if (offset.length() < particles_.get_radius(i)) {
            return i;
        }
    }
    return std::nullopt;
}

bool Simulation::drag_particle(size_t index, double x, double y) {
    return particles_.set_position(index, Vec2(x, y));
}
