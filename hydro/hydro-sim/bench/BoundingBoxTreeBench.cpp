#include <benchmark/benchmark.h>
#include <random>
#include <vector>

#include "hydro-sim/src/Geometry/BoundingBox.hpp"
#include "hydro-sim/src/Physics/Hydroelastic/BoundingBoxTree.hpp"
#include "hydro-sim/src/Utils/TetrahedralMeshFactory.hpp"

using namespace hydro_sim;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

std::vector<BoundingBox> generateRandomBoxes(size_t count, unsigned seed)
{
  std::mt19937 rng{seed};  // Fixed seed for deterministic benchmarks
  std::uniform_real_distribution<double> position{-10.0, 10.0};
  std::uniform_real_distribution<double> size{0.1, 1.0};

  std::vector<BoundingBox> boxes;
  boxes.reserve(count);
  for (size_t i = 0; i < count; ++i)
  {
    Coordinate const min{position(rng), position(rng), position(rng)};
    boxes.emplace_back(
      min, Coordinate{min.x() + size(rng), min.y() + size(rng), min.z() + size(rng)});
  }
  return boxes;
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

static void BM_BoundingBoxTree_Build(benchmark::State& state)
{
  size_t const count = static_cast<size_t>(state.range(0));
  auto const boxes = generateRandomBoxes(count, 42);

  for (auto _ : state)
  {
    BoundingBoxTree tree{boxes};
    benchmark::DoNotOptimize(tree);
  }
  state.SetComplexityN(static_cast<long long>(count));
}
BENCHMARK(BM_BoundingBoxTree_Build)
  ->Arg(100)
  ->Arg(1000)
  ->Arg(10000)
  ->Complexity();

// ============================================================================
// Pair Enumeration
// ============================================================================

/**
 * @brief Simultaneous descent of two trees of random boxes.
 */
static void BM_BoundingBoxTree_OverlappingPairs(benchmark::State& state)
{
  size_t const count = static_cast<size_t>(state.range(0));
  BoundingBoxTree const tree1{generateRandomBoxes(count, 1)};
  BoundingBoxTree const tree2{generateRandomBoxes(count, 2)};

  for (auto _ : state)
  {
    auto pairs = tree1.overlappingPairs(tree2);
    benchmark::DoNotOptimize(pairs);
  }
  state.SetComplexityN(static_cast<long long>(count));
}
BENCHMARK(BM_BoundingBoxTree_OverlappingPairs)
  ->Arg(100)
  ->Arg(1000)
  ->Arg(10000)
  ->Complexity();

/**
 * @brief Brute-force all-pairs test, the baseline the tree replaces.
 */
static void BM_BoundingBoxTree_BruteForceBaseline(benchmark::State& state)
{
  size_t const count = static_cast<size_t>(state.range(0));
  auto const boxes1 = generateRandomBoxes(count, 1);
  auto const boxes2 = generateRandomBoxes(count, 2);

  for (auto _ : state)
  {
    size_t overlaps = 0;
    for (const auto& a : boxes1)
    {
      for (const auto& b : boxes2)
      {
        overlaps += a.overlaps(b) ? 1 : 0;
      }
    }
    benchmark::DoNotOptimize(overlaps);
  }
  state.SetComplexityN(static_cast<long long>(count));
}
BENCHMARK(BM_BoundingBoxTree_BruteForceBaseline)
  ->Arg(100)
  ->Arg(1000)
  ->Complexity();

/**
 * @brief Tetrahedron boxes of two overlapping subdivided cubes.
 */
static void BM_BoundingBoxTree_MeshPairs(benchmark::State& state)
{
  size_t const divisions = static_cast<size_t>(state.range(0));
  TetrahedralMesh const mesh1 =
    TetrahedralMeshFactory::createSubdividedCube(1.0, divisions, 1.0);
  TetrahedralMesh const mesh2 = TetrahedralMeshFactory::createSubdividedCube(
    1.0, divisions, 1.0, ReferenceFrame{Coordinate{0.9, 0.0, 0.0}})
                                  .expressedIn(ReferenceFrame{});

  BoundingBoxTree const tree1{mesh1.getTetrahedronBoundingBoxes()};
  BoundingBoxTree const tree2{mesh2.getTetrahedronBoundingBoxes()};

  for (auto _ : state)
  {
    auto pairs = tree1.overlappingPairs(tree2);
    benchmark::DoNotOptimize(pairs);
  }
  state.SetComplexityN(static_cast<long long>(mesh1.getTetrahedronCount()));
}
BENCHMARK(BM_BoundingBoxTree_MeshPairs)
  ->Arg(2)
  ->Arg(4)
  ->Arg(8)
  ->Arg(16)
  ->Complexity();
