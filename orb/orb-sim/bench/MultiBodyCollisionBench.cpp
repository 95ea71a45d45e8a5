// Ticket: 0009_step_throughput_bench
//
// Multi-ball benchmarks exercising the full WorldModel tick: gravity,
// integration, the relaxation loop and geometry sync.

#include <benchmark/benchmark.h>

#include "MultiBodyScenarios.hpp"

using namespace orb_sim;
using namespace orb_sim::bench;

namespace
{

constexpr int kFramesPerIteration = 20;  // Frames to step per iteration

}  // namespace

// ============================================================================
// Benchmark: LatticeBurst
// ============================================================================

static void BM_MultiBody_LatticeBurst(benchmark::State& state)
{
  int const numBodies = static_cast<int>(state.range(0));

  for (auto _ : state)
  {
    state.PauseTiming();
    MultiBodySetup setup;
    setupLatticeBurst(setup, numBodies);
    state.ResumeTiming();

    setup.stepFrames(kFramesPerIteration);
    benchmark::DoNotOptimize(setup.world.getTime());
  }

  state.SetItemsProcessed(state.iterations() * kFramesPerIteration *
                          numBodies);
}
BENCHMARK(BM_MultiBody_LatticeBurst)
  ->Arg(2)
  ->Arg(8)
  ->Arg(27)
  ->Arg(64)
  ->Unit(benchmark::kMillisecond);

// ============================================================================
// Benchmark: ColumnDrop
// ============================================================================

static void BM_MultiBody_ColumnDrop(benchmark::State& state)
{
  int const numBodies = static_cast<int>(state.range(0));

  for (auto _ : state)
  {
    state.PauseTiming();
    MultiBodySetup setup;
    setupColumnDrop(setup, numBodies);
    state.ResumeTiming();

    setup.stepFrames(kFramesPerIteration);
    benchmark::DoNotOptimize(setup.world.getTime());
  }

  state.SetItemsProcessed(state.iterations() * kFramesPerIteration *
                          numBodies);
}
BENCHMARK(BM_MultiBody_ColumnDrop)
  ->Arg(8)
  ->Arg(32)
  ->Arg(64)
  ->Unit(benchmark::kMillisecond);

// ============================================================================
// Benchmark: Single step, no accumulator
// ============================================================================

static void BM_WorldModel_Step(benchmark::State& state)
{
  int const numBodies = static_cast<int>(state.range(0));

  MultiBodySetup setup;
  setupLatticeBurst(setup, numBodies);

  for (auto _ : state)
  {
    benchmark::DoNotOptimize(setup.world.step(1.0e-3));
  }

  state.SetItemsProcessed(state.iterations() * numBodies);
}
BENCHMARK(BM_WorldModel_Step)->Arg(2)->Arg(16)->Arg(64);

BENCHMARK_MAIN();
