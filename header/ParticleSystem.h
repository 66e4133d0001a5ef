#pragma once
#include "Vec2.h"
#include "EventSystem.h"
#include <vector>
#include <cstddef>

// Structure-of-arrays particle store. Owns every particle exclusively; the
// solvers, the integrator and the collision resolver mutate it in place.
class ParticleSystem {
public:
    ParticleSystem(size_t max_particles, EventBus& event_bus);
    
    // Particle management. Returns false when the store is full or the
    // mass/radius invariant would be violated.
    bool add_particle(const Vec2& pos, const Vec2& vel, double mass, double radius);
    void clear_particles();
    
    // Between-tick overrides (drag handling, scene setup)
    bool set_position(size_t index, const Vec2& pos);
    bool set_velocity(size_t index, const Vec2& vel);
    
    size_t get_particle_count() const { return particle_count_; }
    size_t get_max_particles() const { return max_particles_; }
    
    const std::vector<double>& get_positions_x() const { return positions_x_; }
    const std::vector<double>& get_positions_y() const { return positions_y_; }
    const std::vector<double>& get_velocities_x() const { return velocities_x_; }
    const std::vector<double>& get_velocities_y() const { return velocities_y_; }
    const std::vector<double>& get_forces_x() const { return forces_x_; }
    const std::vector<double>& get_forces_y() const { return forces_y_; }
    const std::vector<double>& get_masses() const { return masses_; }
    const std::vector<double>& get_radii() const { return radii_; }
    
    // Hot-path access for the physics phases
    std::vector<double>& positions_x() { return positions_x_; }
    std::vector<double>& positions_y() { return positions_y_; }
    std::vector<double>& velocities_x() { return velocities_x_; }
    std::vector<double>& velocities_y() { return velocities_y_; }
    std::vector<double>& forces_x() { return forces_x_; }
    std::vector<double>& forces_y() { return forces_y_; }
    
    Vec2 get_position(size_t index) const;
    Vec2 get_velocity(size_t index) const;
    Vec2 get_force(size_t index) const;
    double get_mass(size_t index) const;
    double get_radius(size_t index) const;
    
    // Aggregate diagnostics
    double max_speed() const;
    double min_radius() const;
    double total_mass() const;
    Vec2 total_momentum() const;
    double kinetic_energy() const;
    
    void clear_forces();
    
    // Interleaved copies handed to the render collaborator
    void prepare_render_data();
    const std::vector<double>& get_render_positions() const { return render_positions_; }
    const std::vector<double>& get_render_speeds() const { return render_speeds_; }
    
private:
    size_t max_particles_;
    size_t particle_count_;
    EventBus& event_bus_;
    
    std::vector<double> positions_x_, positions_y_;
    std::vector<double> velocities_x_, velocities_y_;
    std::vector<double> forces_x_, forces_y_;
    std::vector<double> masses_;
    std::vector<double> radii_;
    
    std::vector<double> render_positions_;  // [x0,y0,x1,y1,...]
    std::vector<double> render_speeds_;
};
