#include "ParticleSystem.h"
#include <algorithm>
#include <cassert>
#include <cmath>

ParticleSystem::ParticleSystem(size_t max_particles, EventBus& event_bus) 
    : max_particles_(max_particles), 
      particle_count_(0), 
      event_bus_(event_bus) {
    
    positions_x_.resize(max_particles);
    positions_y_.resize(max_particles);
    velocities_x_.resize(max_particles);
    velocities_y_.resize(max_particles);
    forces_x_.resize(max_particles);
    forces_y_.resize(max_particles);
    masses_.resize(max_particles);
    radii_.resize(max_particles);
    
    render_positions_.resize(max_particles * 2);
    render_speeds_.resize(max_particles);
}

bool ParticleSystem::add_particle(const Vec2& pos, const Vec2& vel, double mass, double radius) {
    assert(mass > 0.0 && "particle mass must be positive");
    assert(radius > 0.0 && "particle radius must be positive");
    if (!(mass > 0.0) || !(radius > 0.0)) {
        return false;
    }
    if (particle_count_ >= max_particles_) {
        return false;
    }
    
    size_t idx = particle_count_;
    positions_x_[idx] = pos.x;
    positions_y_[idx] = pos.y;
    velocities_x_[idx] = vel.x;
    velocities_y_[idx] = vel.y;
    forces_x_[idx] = 0.0;
    forces_y_[idx] = 0.0;
    masses_[idx] = mass;
    radii_[idx] = radius;
    
    particle_count_++;
    
    ParticleAddedEvent event{idx, pos.x, pos.y, vel.x, vel.y, mass, radius};
    event_bus_.emit(Events::PARTICLE_ADDED, event);
    
    return true;
}

void ParticleSystem::clear_particles() {
    particle_count_ = 0;
}

bool ParticleSystem::set_position(size_t index, const Vec2& pos) {
    if (index >= particle_count_) return false;
    positions_x_[index] = pos.x;
    positions_y_[index] = pos.y;
    return true;
}

bool ParticleSystem::set_velocity(size_t index, const Vec2& vel) {
    if (index >= particle_count_) return false;
    velocities_x_[index] = vel.x;
    velocities_y_[index] = vel.y;
    return true;
}

void ParticleSystem::clear_forces() {
    std::fill(forces_x_.begin(), forces_x_.begin() + particle_count_, 0.0);
    std::fill(forces_y_.begin(), forces_y_.begin() + particle_count_, 0.0);
}

double ParticleSystem::max_speed() const {
    double max_sq = 0.0;
    for (size_t i = 0; i < particle_count_; ++i) {
        const double v2 = velocities_x_[i] * velocities_x_[i] + velocities_y_[i] * velocities_y_[i];
        max_sq = std::max(max_sq, v2);
    }
    return std::sqrt(max_sq);
}

double ParticleSystem::min_radius() const {
    if (particle_count_ == 0) return 0.0;
    return *std::min_element(radii_.begin(), radii_.begin() + particle_count_);
}

double ParticleSystem::total_mass() const {
    double m = 0.0;
    for (size_t i = 0; i < particle_count_; ++i) m += masses_[i];
    return m;
}

Vec2 ParticleSystem::total_momentum() const {
    Vec2 p;
    for (size_t i = 0; i < particle_count_; ++i) {
        p.x += masses_[i] * velocities_x_[i];
        p.y += masses_[i] * velocities_y_[i];
    }
    return p;
}

double ParticleSystem::kinetic_energy() const {
    double e = 0.0;
    for (size_t i = 0; i < particle_count_; ++i) {
        const double v2 = velocities_x_[i] * velocities_x_[i] + velocities_y_[i] * velocities_y_[i];
        e += 0.5 * masses_[i] * v2;
    }
    return e;
}

void ParticleSystem::prepare_render_data() {
    for (size_t i = 0; i < particle_count_; ++i) {
        render_positions_[i * 2 + 0] = positions_x_[i];
        render_positions_[i * 2 + 1] = positions_y_[i];
        render_speeds_[i] = std::hypot(velocities_x_[i], velocities_y_[i]);
    }
}

Vec2 ParticleSystem::get_position(size_t index) const {
    if (index >= particle_count_) return Vec2();
    return Vec2(positions_x_[index], positions_y_[index]);
}

Vec2 ParticleSystem::get_velocity(size_t index) const {
    if (index >= particle_count_) return Vec2();
    return Vec2(velocities_x_[index], velocities_y_[index]);
}

Vec2 ParticleSystem::get_force(size_t index) const {
    if (index >= particle_count_) return Vec2();
    return Vec2(forces_x_[index], forces_y_[index]);
}

double ParticleSystem::get_mass(size_t index) const {
    if (index >= particle_count_) return 0.0;
    return masses_[index];
}

double ParticleSystem::get_radius(size_t index) const {
    if (index >= particle_count_) return 0.0;
    return radii_[index];
}
