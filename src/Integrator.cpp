#include "Integrator.h"
#include "ParticleSystem.h"
#include <algorithm>

double compute_adaptive_time_step(const ParticleSystem& particles, double dt_max, double softening_eps) {
    if (particles.get_particle_count() == 0) return dt_max;
    const double radius = particles.min_radius();
    return std::min(dt_max, radius / (particles.max_speed() + softening_eps));
}

void integrate_semi_implicit_euler(ParticleSystem& particles, double dt) {
    const size_t N = particles.get_particle_count();
    const double* const masses = particles.get_masses().data();
    double* const x  = particles.positions_x().data();
    double* const y  = particles.positions_y().data();
    double* const vx = particles.velocities_x().data();
    double* const vy = particles.velocities_y().data();
    double* const fx = particles.forces_x().data();
    double* const fy = particles.forces_y().data();

    for (size_t i = 0; i < N; ++i) {
        const double inv_mass = 1.0 / masses[i];
        
        // Kick
        vx[i] += fx[i] * inv_mass * dt;
        vy[i] += fy[i] * inv_mass * dt;
        
        // Drift with the updated velocity
        x[i] += vx[i] * dt;
        y[i] += vy[i] * dt;

        fx[i] = 0.0;
        fy[i] = 0.0;
    }
}
