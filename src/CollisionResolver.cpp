#include "CollisionResolver.h"
#include "ParticleSystem.h"
#include <Eigen/Dense>
#include <algorithm>

size_t CollisionResolver::resolve_particle_collisions(ParticleSystem& particles) const {
    const size_t N = particles.get_particle_count();
    const double* const m = particles.get_masses().data();
    const double* const r = particles.get_radii().data();
    double* const x  = particles.positions_x().data();
    double* const y  = particles.positions_y().data();
    double* const vx = particles.velocities_x().data();
    double* const vy = particles.velocities_y().data();

    const double damping = config_.damping_object;
    size_t contacts = 0;

    for (size_t i = 0; i + 1 < N; ++i) {
        for (size_t j = i + 1; j < N; ++j) {
            const Eigen::Vector2d delta(x[j] - x[i], y[j] - y[i]);
            const double distance = delta.norm();
            const double reach = r[i] + r[j];
            if (distance >= reach) continue;

            ++contacts;

            // Coincident centres: any fixed unit normal separates them
            const Eigen::Vector2d normal = distance > 0.0 ? Eigen::Vector2d(delta / distance)
                                                          : Eigen::Vector2d(1.0, 0.0);
            const Eigen::Vector2d tangent(-normal.y(), normal.x());

            const Eigen::Vector2d push = normal * (0.5 * (reach - distance));
            x[i] -= push.x();
            y[i] -= push.y();
            x[j] += push.x();
            y[j] += push.y();

            const Eigen::Vector2d v1(vx[i], vy[i]);
            const Eigen::Vector2d v2(vx[j], vy[j]);
            const double v1n = v1.dot(normal);
            const double v2n = v2.dot(normal);
            const double v1t = v1.dot(tangent);
            const double v2t = v2.dot(tangent);

            const double m1 = m[i], m2 = m[j];
            const double total = m1 + m2;
            const double v1n_new = ((v1n * (m1 - m2) + 2.0 * m2 * v2n) / total) * damping;
            const double v2n_new = ((v2n * (m2 - m1) + 2.0 * m1 * v1n) / total) * damping;

            const Eigen::Vector2d v1_new = tangent * v1t + normal * v1n_new;
            const Eigen::Vector2d v2_new = tangent * v2t + normal * v2n_new;
            vx[i] = v1_new.x();
            vy[i] = v1_new.y();
            vx[j] = v2_new.x();
            vy[j] = v2_new.y();
        }
    }
    return contacts;
}

size_t CollisionResolver::resolve_wall_collisions(ParticleSystem& particles) const {
    const size_t N = particles.get_particle_count();
    const double* const r = particles.get_radii().data();
    double* const x  = particles.positions_x().data();
    double* const y  = particles.positions_y().data();
    double* const vx = particles.velocities_x().data();
    double* const vy = particles.velocities_y().data();

    const double width = config_.world_width;
    const double height = config_.world_height;
    const double damping = config_.damping_wall;
    size_t hits = 0;

    for (size_t i = 0; i < N; ++i) {
        if (x[i] - r[i] < 0.0) {
            vx[i] = -vx[i] * damping;
            x[i] = r[i];
            ++hits;
        } else if (x[i] + r[i] > width) {
            vx[i] = -vx[i] * damping;
            x[i] = width - r[i];
            ++hits;
        }

        if (y[i] - r[i] < 0.0) {
            vy[i] = -vy[i] * damping;
            y[i] = r[i];
            ++hits;
        } else if (y[i] + r[i] > height) {
            vy[i] = -vy[i] * damping;
            y[i] = height - r[i];
            ++hits;
        }
    }
    return hits;
}

void CollisionResolver::clamp_to_bounds(ParticleSystem& particles) const {
    const size_t N = particles.get_particle_count();
    const double* const r = particles.get_radii().data();
    double* const x = particles.positions_x().data();
    double* const y = particles.positions_y().data();

    for (size_t i = 0; i < N; ++i) {
        x[i] = std::clamp(x[i], r[i], std::max(r[i], config_.world_width - r[i]));
        y[i] = std::clamp(y[i], r[i], std::max(r[i], config_.world_height - r[i]));
    }
}
