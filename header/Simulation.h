#pragma once
#include "Vec2.h"
#include "EventSystem.h"
#include "SimulationConfig.h"
#include "ParticleSystem.h"
#include "ForceSolver.h"
#include "CollisionResolver.h"
#include <cstdint>
#include <memory>
#include <optional>

struct TickReport {
    double dt;
    size_t particle_contacts;
    size_t wall_contacts;
    size_t tick;          // ticks completed so far, including this one
    bool advanced;        // false when paused
};

// Orchestrates one tick: solve forces -> integrate -> particle collisions ->
// wall collisions -> clamp. The step size is passed in (or computed per
// tick by update()), never stored between ticks.
class Simulation {
public:
    Simulation(const SimulationConfig& config, EventBus& event_bus);
    ~Simulation();

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    // One tick with the adaptive step; a no-op while paused.
    TickReport update();

    // One tick with an explicit step, paused or not.
    TickReport step(double dt);

    // Reseeds config().particle_count particles uniformly inside the world.
    void reset(uint32_t seed);

    void set_solver(SolverKind kind);
    SolverKind solver_kind() const { return solver_->kind(); }
    ForceSolver& solver() { return *solver_; }
    const ForceSolver& solver() const { return *solver_; }

    void pause();
    void resume();
    void toggle_pause();
    bool is_paused() const { return paused_; }

    // First particle whose disc strictly contains (x, y)
    std::optional<size_t> pick_particle(double x, double y) const;

    // Between-tick position override used for dragging. The particle keeps
    // its velocity and is put back inside the walls by the next tick.
    bool drag_particle(size_t index, double x, double y);

    ParticleSystem& particles() { return particles_; }
    const ParticleSystem& particles() const { return particles_; }
    const SimulationConfig& config() const { return config_; }
    const CollisionResolver& collision_resolver() const { return collisions_; }
    size_t tick_count() const { return iteration_count_; }

private:
    static const SimulationConfig& validated(const SimulationConfig& config);
    void emit_tick_events(const TickReport& report);

    SimulationConfig config_;
    EventBus& event_bus_;
    ParticleSystem particles_;
    std::unique_ptr<ForceSolver> solver_;
    CollisionResolver collisions_;
    bool paused_;
    size_t iteration_count_;
};
