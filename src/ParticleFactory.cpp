#include "ParticleFactory.h"
#include "ParticleSystem.h"
#include <algorithm>
#include <random>
#include <vector>

ParticleFactory::ParticleFactory(ParticleSystem& particle_system)
    : particle_system_(particle_system) {}

size_t ParticleFactory::add_uniform(size_t count, double radius, double mass,
                                    const geom::AABBd& world, uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> dist_x(world.min_x + radius, world.max_x - radius);
    std::uniform_real_distribution<double> dist_y(world.min_y + radius, world.max_y - radius);

    size_t added = 0;
    for (size_t i = 0; i < count; ++i) {
        const Vec2 pos(dist_x(rng), dist_y(rng));
        if (!particle_system_.add_particle(pos, Vec2(), mass, radius)) break;
        ++added;
    }
    return added;
}

size_t ParticleFactory::add_clustered(size_t count, size_t clusters, double spread,
                                      double radius, double mass,
                                      const geom::AABBd& world, uint32_t seed) {
    if (clusters == 0) return 0;

    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> centre_x(world.min_x + radius, world.max_x - radius);
    std::uniform_real_distribution<double> centre_y(world.min_y + radius, world.max_y - radius);
    std::normal_distribution<double> jitter(0.0, spread);
    std::uniform_int_distribution<size_t> pick(0, clusters - 1);

    std::vector<Vec2> centres(clusters);
    for (auto& c : centres) {
        c = Vec2(centre_x(rng), centre_y(rng));
    }

    size_t added = 0;
    for (size_t i = 0; i < count; ++i) {
        const Vec2& c = centres[pick(rng)];
        const double x = std::clamp(c.x + jitter(rng), world.min_x + radius, world.max_x - radius);
        const double y = std::clamp(c.y + jitter(rng), world.min_y + radius, world.max_y - radius);
        if (!particle_system_.add_particle(Vec2(x, y), Vec2(), mass, radius)) break;
        ++added;
    }
    return added;
}

size_t ParticleFactory::add_lattice(size_t columns, size_t rows, const Vec2& origin, double spacing,
                                    double radius, double mass) {
    size_t added = 0;
    for (size_t row = 0; row < rows; ++row) {
        for (size_t col = 0; col < columns; ++col) {
            const Vec2 pos(origin.x + col * spacing, origin.y + row * spacing);
            if (!particle_system_.add_particle(pos, Vec2(), mass, radius)) return added;
            ++added;
        }
    }
    return added;
}
