#pragma once

#include "Vec2.h"
#include "Bounds.hpp"
#include <cstddef>
#include <cstdint>

class ParticleSystem;

// Scene seeding for the simulation and for tests/benchmarks
class ParticleFactory {
public:
    explicit ParticleFactory(ParticleSystem& particle_system);
    
    // Uniform placement with every disc fully inside `world`, zero velocity.
    // Returns the number of particles actually added.
    size_t add_uniform(size_t count, double radius, double mass,
                       const geom::AABBd& world, uint32_t seed);

    // Gaussian blobs around `clusters` random centres, clamped into `world`
    size_t add_clustered(size_t count, size_t clusters, double spread,
                         double radius, double mass,
                         const geom::AABBd& world, uint32_t seed);

    // Square lattice with `spacing` between centres starting at `origin`
    size_t add_lattice(size_t columns, size_t rows, const Vec2& origin, double spacing,
                       double radius, double mass);

private:
    ParticleSystem& particle_system_;
};
