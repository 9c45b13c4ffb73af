#include <benchmark/benchmark.h>

#include <chrono>

#include "twisty-core/src/Collision/BoundsCollisionSystem.hpp"
#include "twisty-core/src/Cube/CubeAssembly.hpp"
#include "twisty-core/src/Engine/PuzzleEngine.hpp"
#include "twisty-utils/src/Logging.hpp"

using namespace twisty_core;

// ============================================================================
// Collision traversal
// ============================================================================

/**
 * @brief One face traversal against the full cubie population, with the
 * cubie box cache warm.
 */
static void BM_Traverse_Cached(benchmark::State& state)
{
  SceneGraph scene;
  CubeAssembly const assembly{scene};
  BoundsCollisionSystem collision{
    scene, 0.2, twisty_utils::makeNullLogger("bench")};
  NodeId const volume = *scene.find("TOP_SIDE_collider");

  for (auto _ : state)
  {
    benchmark::DoNotOptimize(collision.traverse(volume, assembly.cubies()));
  }
}
BENCHMARK(BM_Traverse_Cached);

/**
 * @brief Traversal after dropping the cache, as done before every move.
 */
static void BM_Traverse_Invalidated(benchmark::State& state)
{
  SceneGraph scene;
  CubeAssembly const assembly{scene};
  BoundsCollisionSystem collision{
    scene, 0.2, twisty_utils::makeNullLogger("bench")};
  NodeId const volume = *scene.find("TOP_SIDE_collider");

  for (auto _ : state)
  {
    collision.invalidate();
    benchmark::DoNotOptimize(collision.traverse(volume, assembly.cubies()));
  }
}
BENCHMARK(BM_Traverse_Invalidated);

// ============================================================================
// Full moves
// ============================================================================

/**
 * @brief Complete shuffle of a fresh cube, by membership refresh strategy.
 *
 * state.range(0): 0 = invalidate, 1 = perturb
 */
static void BM_ShuffleReplay(benchmark::State& state)
{
  EngineConfig config;
  config.shuffle.seed = 42;
  config.collision.refresh = state.range(0) == 0 ? MembershipRefresh::Invalidate
                                                 : MembershipRefresh::Perturb;
  auto logger = twisty_utils::makeNullLogger("bench");

  for (auto _ : state)
  {
    PuzzleEngine engine{config, logger};
    engine.startShuffle();
    engine.update(std::chrono::milliseconds{60000});
    benchmark::DoNotOptimize(engine.moveHistory().size());
  }
}
BENCHMARK(BM_ShuffleReplay)->Arg(0)->Arg(1);

BENCHMARK_MAIN();
