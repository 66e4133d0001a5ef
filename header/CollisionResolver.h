#pragma once
#include <cstddef>

class ParticleSystem;

// Positional correction plus frictionless impulse exchange between discs,
// and reflection off the four walls of [0,width] x [0,height].
class CollisionResolver {
public:
    struct Config {
        double world_width;
        double world_height;
        double damping_object;   // 1 = perfectly elastic
        double damping_wall;

        Config()
            : world_width(1280.0), world_height(720.0)
            , damping_object(0.99), damping_wall(0.99)
        {}
    };

    explicit CollisionResolver(const Config& config = Config{}) : config_(config) {}

    // Returns the number of overlapping pairs that were separated.
    size_t resolve_particle_collisions(ParticleSystem& particles) const;

    // Must run after resolve_particle_collisions(). Returns the number of wall hits.
    size_t resolve_wall_collisions(ParticleSystem& particles) const;

    // Final containment guard: radius <= x <= width - radius, same for y.
    void clamp_to_bounds(ParticleSystem& particles) const;

    const Config& get_config() const { return config_; }

private:
    Config config_;
};
