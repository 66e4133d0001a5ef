#pragma once
#include <cstddef>

class ParticleSystem;

// Adaptive step: min(dt_max, r_min / (v_max + eps)), measured on the state
// before integration so no particle travels further than one radius.
double compute_adaptive_time_step(const ParticleSystem& particles, double dt_max, double softening_eps);

// Semi-implicit Euler: v += f/m*dt, x += v*dt, then f = 0.
void integrate_semi_implicit_euler(ParticleSystem& particles, double dt);
