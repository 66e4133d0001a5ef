#ifndef CB_TESTING
#define CB_TESTING
#endif
#include <gtest/gtest.h>
#include "ForceSolver.h"
#include "ParticleSystem.h"
#include "EventSystem.h"
#include "CBTestHooks.h"
#include <cmath>
#include <random>

namespace {

const ForceLaw kUnitLaw{1.0, 1e30, 1e-7};
const geom::AABBd kWorld{0.0, 0.0, 800.0, 600.0};

void seed_random(ParticleSystem& ps, size_t N, uint32_t seed) {
  std::mt19937 rng(seed);
  std::uniform_real_distribution<double> dx(10.0, 790.0);
  std::uniform_real_distribution<double> dy(10.0, 590.0);
  std::uniform_real_distribution<double> dm(0.5, 2.0);
  for (size_t i = 0; i < N; ++i) {
    ps.add_particle({dx(rng), dy(rng)}, {0, 0}, dm(rng), 1.0);
  }
}

} // namespace

TEST(DirectSolver, PairForcesAreEqualAndOpposite) {
  EventBus bus;
  ParticleSystem ps(2, bus);
  ps.add_particle({120.0, 80.0}, {0, 0}, 3.0, 2.0);
  ps.add_particle({310.0, 415.0}, {0, 0}, 7.0, 5.0);

  DirectForceSolver solver(kUnitLaw);
  solver.solve(ps);

  const Vec2 a = ps.get_force(0);
  const Vec2 b = ps.get_force(1);
  EXPECT_NE(a.length(), 0.0);
  EXPECT_EQ(a.x, -b.x);
  EXPECT_EQ(a.y, -b.y);
}

TEST(DirectSolver, NetForceVanishesForManyBodies) {
  EventBus bus;
  ParticleSystem ps(60, bus);
  seed_random(ps, 60, 3);

  DirectForceSolver solver(kUnitLaw);
  solver.solve(ps);

  double sum_x = 0.0, sum_y = 0.0, scale = 0.0;
  for (size_t i = 0; i < ps.get_particle_count(); ++i) {
    const Vec2 f = ps.get_force(i);
    sum_x += f.x;
    sum_y += f.y;
    scale = std::max(scale, f.length());
  }
  EXPECT_NEAR(sum_x, 0.0, 1e-12 * scale * 60);
  EXPECT_NEAR(sum_y, 0.0, 1e-12 * scale * 60);
}

// The force vector on a particle points at its partner: the law as written
// pulls bodies together even though the constant is Coulomb's.
TEST(DirectSolver, ForceLawIsAttractive) {
  EventBus bus;
  ParticleSystem ps(2, bus);
  ps.add_particle({100.0, 300.0}, {0, 0}, 1.0, 1.0);
  ps.add_particle({200.0, 300.0}, {0, 0}, 1.0, 1.0);

  DirectForceSolver solver(kUnitLaw);
  solver.solve(ps);

  EXPECT_GT(ps.get_force(0).x, 0.0);
  EXPECT_LT(ps.get_force(1).x, 0.0);
  EXPECT_NEAR(ps.get_force(0).x, 1e-4, 1e-12);
  EXPECT_DOUBLE_EQ(ps.get_force(0).y, 0.0);
}

TEST(DirectSolver, OverlappingPairExertsNoForce) {
  EventBus bus;
  ParticleSystem ps(2, bus);
  ps.add_particle({100.0, 100.0}, {0, 0}, 1.0, 10.0);
  ps.add_particle({115.0, 100.0}, {0, 0}, 1.0, 10.0);

  DirectForceSolver solver(kUnitLaw);
  solver.solve(ps);

  EXPECT_EQ(ps.get_force(0).x, 0.0);
  EXPECT_EQ(ps.get_force(1).x, 0.0);
}

TEST(DirectSolver, MagnitudeIsClampedToMaxForce) {
  EventBus bus;
  ParticleSystem ps(2, bus);
  ps.add_particle({100.0, 300.0}, {0, 0}, 1e12, 10.0);
  ps.add_particle({200.0, 300.0}, {0, 0}, 1e12, 10.0);

  DirectForceSolver solver(ForceLaw{8.9875e9, 1e12, 1e-7});
  solver.solve(ps);

  // The cap applies to the magnitude; the direction uses the softened distance
  const double expected = 1e12 * 100.0 / std::sqrt(1e4 + 1e-7);
  EXPECT_NEAR(ps.get_force(0).x, expected, 1e-3);
  EXPECT_NEAR(ps.get_force(1).x, -expected, 1e-3);
  EXPECT_LT(ps.get_force(0).length(), 1e12);
}

TEST(DirectSolver, RepeatedSolveAccumulates) {
  EventBus bus;
  ParticleSystem ps(2, bus);
  ps.add_particle({100.0, 300.0}, {0, 0}, 1.0, 1.0);
  ps.add_particle({200.0, 300.0}, {0, 0}, 1.0, 1.0);

  DirectForceSolver solver(kUnitLaw);
  solver.solve(ps);
  const double once = ps.get_force(0).x;
  solver.solve(ps);
  EXPECT_DOUBLE_EQ(ps.get_force(0).x, 2.0 * once);

  ps.clear_forces();
  EXPECT_EQ(ps.get_force(0).x, 0.0);
}

TEST(BarnesHutSolver, ConvergesToDirectAtSmallTheta) {
  EventBus bus;
  ParticleSystem direct_ps(20, bus), tree_ps(20, bus);
  seed_random(direct_ps, 20, 2024);
  seed_random(tree_ps, 20, 2024);

  DirectForceSolver direct(kUnitLaw);
  direct.solve(direct_ps);

  BarnesHutForceSolver::Config cfg;
  cfg.theta = 0.01;
  BarnesHutForceSolver tree(kUnitLaw, kWorld, cfg);
  tree.solve(tree_ps);

  for (size_t i = 0; i < 20; ++i) {
    const Vec2 ref = direct_ps.get_force(i);
    const Vec2 approx = tree_ps.get_force(i);
    const double rel = (approx - ref).length() / std::max(ref.length(), 1e-300);
    EXPECT_LT(rel, 0.01) << "particle " << i;
  }
}

TEST(BarnesHutSolver, SmallSetStaysInRootLeaf) {
  EventBus bus;
  ParticleSystem direct_ps(4, bus), tree_ps(4, bus);
  for (auto* ps : {&direct_ps, &tree_ps}) {
    ps->add_particle({100.0, 100.0}, {0, 0}, 1.0, 1.0);
    ps->add_particle({500.0, 120.0}, {0, 0}, 2.0, 1.0);
    ps->add_particle({300.0, 450.0}, {0, 0}, 3.0, 1.0);
    ps->add_particle({700.0, 550.0}, {0, 0}, 4.0, 1.0);
  }

  DirectForceSolver direct(kUnitLaw);
  direct.solve(direct_ps);
  BarnesHutForceSolver tree(kUnitLaw, kWorld);
  tree.solve(tree_ps);

  ASSERT_EQ(tree.tree().node_count(), 1u);
  for (size_t i = 0; i < 4; ++i) {
    EXPECT_NEAR(tree_ps.get_force(i).x, direct_ps.get_force(i).x, 1e-15);
    EXPECT_NEAR(tree_ps.get_force(i).y, direct_ps.get_force(i).y, 1e-15);
  }
}

TEST(BarnesHutSolver, LargeThetaApproximatesDistantClusters) {
  EventBus bus;
  ParticleSystem ps(64, bus);
  seed_random(ps, 64, 99);

  BarnesHutForceSolver::Config cfg;
  cfg.theta = 1.0;
  BarnesHutForceSolver coarse(kUnitLaw, kWorld, cfg);
  coarse.solve(ps);
  const auto coarse_stats = coarse.last_stats();

  ps.clear_forces();
  cfg.theta = 0.01;
  BarnesHutForceSolver fine(kUnitLaw, kWorld, cfg);
  fine.solve(ps);

  EXPECT_GT(coarse_stats.approximations, 0u);
  EXPECT_LT(coarse_stats.nodes_visited, fine.last_stats().nodes_visited);
}

TEST(BarnesHutSolver, HookForceMatchesAccumulator) {
  EventBus bus;
  ParticleSystem ps(30, bus);
  seed_random(ps, 30, 17);

  BarnesHutForceSolver tree(kUnitLaw, kWorld);
  tree.solve(ps);

  for (size_t i = 0; i < ps.get_particle_count(); ++i) {
    const Vec2 hook = CBTestHooks::force_on(tree, ps, i);
    EXPECT_DOUBLE_EQ(hook.x, ps.get_force(i).x);
    EXPECT_DOUBLE_EQ(hook.y, ps.get_force(i).y);
  }
}

TEST(BarnesHutSolver, CoincidentCentreOfMassIsSkipped) {
  EventBus bus;
  ParticleSystem ps(6, bus);
  // Symmetric ring around (200,200): the internal node's centre of mass
  // coincides with the probe particle placed at the same spot.
  ps.add_particle({190.0, 190.0}, {0, 0}, 1.0, 1.0);
  ps.add_particle({210.0, 190.0}, {0, 0}, 1.0, 1.0);
  ps.add_particle({190.0, 210.0}, {0, 0}, 1.0, 1.0);
  ps.add_particle({210.0, 210.0}, {0, 0}, 1.0, 1.0);
  ps.add_particle({200.0, 200.0}, {0, 0}, 1e-9, 1.0);

  BarnesHutForceSolver tree(kUnitLaw, geom::AABBd{0.0, 0.0, 400.0, 400.0});
  tree.solve(ps);

  EXPECT_GT(tree.last_stats().degenerate_skips, 0u);
  for (size_t i = 0; i < ps.get_particle_count(); ++i) {
    EXPECT_TRUE(std::isfinite(ps.get_force(i).x));
    EXPECT_TRUE(std::isfinite(ps.get_force(i).y));
  }
}

TEST(BarnesHutSolver, ThreadedSolveMatchesSerial) {
#ifdef _OPENMP
  EventBus bus;
  ParticleSystem serial_ps(100, bus), threaded_ps(100, bus);
  seed_random(serial_ps, 100, 31);
  seed_random(threaded_ps, 100, 31);

  BarnesHutForceSolver::Config cfg;
  BarnesHutForceSolver serial(kUnitLaw, kWorld, cfg);
  cfg.enable_threading = true;
  BarnesHutForceSolver threaded(kUnitLaw, kWorld, cfg);

  serial.solve(serial_ps);
  threaded.solve(threaded_ps);

  // Each particle's walk is independent, so the sums are bit-identical
  for (size_t i = 0; i < 100; ++i) {
    EXPECT_EQ(threaded_ps.get_force(i).x, serial_ps.get_force(i).x) << "particle " << i;
    EXPECT_EQ(threaded_ps.get_force(i).y, serial_ps.get_force(i).y) << "particle " << i;
  }
  EXPECT_EQ(threaded.last_stats().nodes_visited, serial.last_stats().nodes_visited);
  EXPECT_EQ(threaded.last_stats().leaf_pairs, serial.last_stats().leaf_pairs);
  EXPECT_EQ(threaded.last_stats().approximations, serial.last_stats().approximations);
  EXPECT_EQ(threaded.last_stats().degenerate_skips, serial.last_stats().degenerate_skips);
  EXPECT_GT(threaded.last_stats().nodes_visited, 0u);
#else
  GTEST_SKIP() << "built without OpenMP";
#endif
}

TEST(SolverFactory, BuildsRequestedKind) {
  SimulationConfig cfg;
  auto direct = make_force_solver(SolverKind::Direct, cfg);
  auto tree = make_force_solver(SolverKind::BarnesHut, cfg);
  ASSERT_NE(direct, nullptr);
  ASSERT_NE(tree, nullptr);
  EXPECT_EQ(direct->kind(), SolverKind::Direct);
  EXPECT_EQ(tree->kind(), SolverKind::BarnesHut);
  EXPECT_STREQ(tree->name(), "barnes-hut");

  auto* bh = dynamic_cast<BarnesHutForceSolver*>(tree.get());
  ASSERT_NE(bh, nullptr);
  EXPECT_DOUBLE_EQ(bh->theta(), cfg.theta);
  EXPECT_EQ(bh->get_config().leaf_capacity, cfg.leaf_capacity);
}
