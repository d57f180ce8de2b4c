#include <benchmark/benchmark.h>

#include "hydro-sim/src/Environment/ReferenceFrame.hpp"
#include "hydro-sim/src/Physics/Hydroelastic/ContactForceSolver.hpp"
#include "hydro-sim/src/Utils/TetrahedralMeshFactory.hpp"

using namespace hydro_sim;

// ============================================================================
// End-to-End Contact
// ============================================================================

/**
 * @brief Full contact computation between two subdivided cubes.
 *
 * The second cube overlaps the first by 0.1 along x. The argument is the
 * number of divisions per axis, so each mesh has 6 * n^3 tetrahedra.
 */
static void BM_ContactForce_SubdividedCubes(benchmark::State& state)
{
  size_t const divisions = static_cast<size_t>(state.range(0));
  TetrahedralMesh const mesh1 =
    TetrahedralMeshFactory::createSubdividedCube(1.0, divisions, 1000.0);
  TetrahedralMesh const mesh2 = TetrahedralMeshFactory::createSubdividedCube(
    1.0, divisions, 1000.0, ReferenceFrame{Coordinate{0.9, 0.0, 0.0}});

  ContactForceSolver const solver;

  for (auto _ : state)
  {
    HydroelasticContact contact = solver.computeContact(mesh1, mesh2);
    benchmark::DoNotOptimize(contact);
  }
  state.SetComplexityN(static_cast<long long>(mesh1.getTetrahedronCount()));
}
BENCHMARK(BM_ContactForce_SubdividedCubes)
  ->Arg(1)
  ->Arg(2)
  ->Arg(4)
  ->Arg(8)
  ->Complexity();

/**
 * @brief Same as above with per-tetrahedron details attached.
 */
static void BM_ContactForce_WithDetails(benchmark::State& state)
{
  size_t const divisions = static_cast<size_t>(state.range(0));
  TetrahedralMesh const mesh1 =
    TetrahedralMeshFactory::createSubdividedCube(1.0, divisions, 1000.0);
  TetrahedralMesh const mesh2 = TetrahedralMeshFactory::createSubdividedCube(
    1.0, divisions, 1000.0, ReferenceFrame{Coordinate{0.9, 0.0, 0.0}});

  ContactForceSolver const solver;

  for (auto _ : state)
  {
    HydroelasticContact contact = solver.computeContact(mesh1, mesh2, true);
    benchmark::DoNotOptimize(contact);
  }
}
BENCHMARK(BM_ContactForce_WithDetails)->Arg(4);

/**
 * @brief Early exit when the global hulls are apart.
 */
static void BM_ContactForce_Separated(benchmark::State& state)
{
  TetrahedralMesh const mesh1 =
    TetrahedralMeshFactory::createSubdividedCube(1.0, 4, 1000.0);
  TetrahedralMesh const mesh2 = TetrahedralMeshFactory::createSubdividedCube(
    1.0, 4, 1000.0, ReferenceFrame{Coordinate{3.0, 0.0, 0.0}});

  ContactForceSolver const solver;

  for (auto _ : state)
  {
    HydroelasticContact contact = solver.computeContact(mesh1, mesh2);
    benchmark::DoNotOptimize(contact);
  }
}
BENCHMARK(BM_ContactForce_Separated);

BENCHMARK_MAIN();
