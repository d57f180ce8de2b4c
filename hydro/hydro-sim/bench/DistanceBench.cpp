#include <benchmark/benchmark.h>
#include <random>
#include <vector>

#include "hydro-sim/src/DataTypes/Coordinate.hpp"
#include "hydro-sim/src/Geometry/Distance.hpp"
#include "hydro-sim/src/Geometry/Primitives.hpp"

using namespace hydro_sim;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

std::vector<Segment> generateRandomSegments(size_t count)
{
  static std::mt19937 rng{42};  // Fixed seed for deterministic benchmarks
  std::uniform_real_distribution<double> dist{-10.0, 10.0};

  std::vector<Segment> segments;
  segments.reserve(count);
  for (size_t i = 0; i < count; ++i)
  {
    segments.push_back(Segment{Coordinate{dist(rng), dist(rng), dist(rng)},
                               Coordinate{dist(rng), dist(rng), dist(rng)}});
  }
  return segments;
}

std::vector<Coordinate> generateRandomPoints(size_t count)
{
  static std::mt19937 rng{7};
  std::uniform_real_distribution<double> dist{-10.0, 10.0};

  std::vector<Coordinate> points;
  points.reserve(count);
  for (size_t i = 0; i < count; ++i)
  {
    points.emplace_back(dist(rng), dist(rng), dist(rng));
  }
  return points;
}

}  // namespace

// ============================================================================
// Pairwise Routines
// ============================================================================

/**
 * @brief Segment/segment distance over a batch of random segment pairs.
 */
static void BM_Distance_SegmentToSegment(benchmark::State& state)
{
  auto const segments = generateRandomSegments(256);

  for (auto _ : state)
  {
    for (size_t i = 0; i + 1 < segments.size(); i += 2)
    {
      auto result = distance::lineSegmentToLineSegment(segments[i].start,
                                                       segments[i].end,
                                                       segments[i + 1].start,
                                                       segments[i + 1].end);
      benchmark::DoNotOptimize(result);
    }
  }
  state.SetItemsProcessed(state.iterations() * 128);
}
BENCHMARK(BM_Distance_SegmentToSegment);

/**
 * @brief Variant dispatch overhead against the direct routine above.
 */
static void BM_Distance_DispatchSegmentToSegment(benchmark::State& state)
{
  auto const segments = generateRandomSegments(256);
  std::vector<Primitive> primitives(segments.begin(), segments.end());

  for (auto _ : state)
  {
    for (size_t i = 0; i + 1 < primitives.size(); i += 2)
    {
      auto result = computeDistance(primitives[i], primitives[i + 1]);
      benchmark::DoNotOptimize(result);
    }
  }
  state.SetItemsProcessed(state.iterations() * 128);
}
BENCHMARK(BM_Distance_DispatchSegmentToSegment);

// ============================================================================
// Batch Routines
// ============================================================================

static void BM_Distance_PointsToPlaneSigned(benchmark::State& state)
{
  size_t const count = static_cast<size_t>(state.range(0));
  auto const points = generateRandomPoints(count);
  Coordinate const planePoint{0.0, 0.0, 1.0};
  Vector3D const planeNormal{Vector3D{1.0, 2.0, 3.0}.normalized()};

  for (auto _ : state)
  {
    auto distances = distance::pointsToPlaneSigned(points, planePoint, planeNormal);
    benchmark::DoNotOptimize(distances);
  }
  state.SetComplexityN(static_cast<long long>(count));
}
BENCHMARK(BM_Distance_PointsToPlaneSigned)
  ->Arg(64)
  ->Arg(512)
  ->Arg(4096)
  ->Arg(32768)
  ->Complexity();
