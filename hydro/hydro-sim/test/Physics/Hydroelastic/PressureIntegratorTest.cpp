#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

#include "hydro-sim/src/Geometry/Primitives.hpp"
#include "hydro-sim/src/Physics/Hydroelastic/PressureIntegrator.hpp"
#include "hydro-sim/src/Physics/Hydroelastic/TetrahedralMesh.hpp"

using namespace hydro_sim;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

TetrahedralMesh unitTetrahedronMesh(std::vector<double> potentials)
{
  return TetrahedralMesh{{Coordinate{0.0, 0.0, 0.0},
                          Coordinate{1.0, 0.0, 0.0},
                          Coordinate{0.0, 1.0, 0.0},
                          Coordinate{0.0, 0.0, 1.0}},
                         {TetrahedronIndices{0, 1, 2, 3}},
                         std::move(potentials)};
}

Plane planeAtX(double x)
{
  return Plane{Coordinate{x, 0.0, 0.0}, Vector3D{1.0, 0.0, 0.0}};
}

}  // anonymous namespace

// ============================================================================
// Contribution Tests
// ============================================================================

TEST(PressureIntegratorTest, UniformPotential_PressureEqualsPotential)
{
  PressureIntegrator const integrator;
  TetrahedralMesh const mesh = unitTetrahedronMesh({3.0, 3.0, 3.0, 3.0});

  TetrahedronContribution const contribution =
    integrator.integrate(mesh, 0, planeAtX(0.25));

  // Cross section at x = 0.25 is a right triangle with legs 0.75
  ASSERT_EQ(contribution.polygon.size(), 3u);
  EXPECT_NEAR(contribution.area, 0.5 * 0.75 * 0.75, 1e-12);
  EXPECT_NEAR(contribution.pressure, 3.0, 1e-12);
  EXPECT_NEAR(contribution.force, contribution.area * 3.0, 1e-12);
  EXPECT_NEAR(contribution.centroid.x(), 0.25, 1e-12);
  EXPECT_NEAR(contribution.centroid.y(), 0.25, 1e-12);
  EXPECT_NEAR(contribution.centroid.z(), 0.25, 1e-12);
}

TEST(PressureIntegratorTest, LinearPotential_InterpolatedAtCentroid)
{
  // Potential equal to x at each vertex, so the field is p(x, y, z) = x
  PressureIntegrator const integrator;
  TetrahedralMesh const mesh = unitTetrahedronMesh({0.0, 1.0, 0.0, 0.0});

  TetrahedronContribution const contribution =
    integrator.integrate(mesh, 0, planeAtX(0.4));

  EXPECT_NEAR(contribution.pressure, 0.4, 1e-12);
  EXPECT_NEAR(contribution.area, 0.5 * 0.6 * 0.6, 1e-12);
  EXPECT_NEAR(contribution.force, 0.4 * 0.18, 1e-12);
}

TEST(PressureIntegratorTest, QuadSection_UsesBothSortModes)
{
  TetrahedralMesh const mesh{{Coordinate{-1.0, 0.0, -1.0},
                              Coordinate{1.0, 0.0, -1.0},
                              Coordinate{0.0, -1.0, 1.0},
                              Coordinate{0.0, 1.0, 1.0}},
                             {TetrahedronIndices{0, 1, 2, 3}},
                             {2.0, 2.0, 2.0, 2.0}};
  Plane const plane{Coordinate{0.0, 0.0, 0.0}, Vector3D{0.0, 0.0, 1.0}};

  auto const sorted =
    PressureIntegrator{ContactPlaneProjector{true}}.integrate(mesh, 0, plane);
  auto const unsorted =
    PressureIntegrator{ContactPlaneProjector{false}}.integrate(mesh, 0, plane);

  EXPECT_NEAR(sorted.area, 1.0, 1e-12);
  EXPECT_NEAR(sorted.force, 2.0, 1e-12);
  EXPECT_NEAR(unsorted.force, sorted.force, 1e-12);
}

// ============================================================================
// Error Handling
// ============================================================================

TEST(PressureIntegratorTest, NonStraddlingTetrahedron_Throws)
{
  PressureIntegrator const integrator;
  TetrahedralMesh const mesh = unitTetrahedronMesh({1.0, 1.0, 1.0, 1.0});

  EXPECT_THROW(static_cast<void>(integrator.integrate(mesh, 0, planeAtX(2.0))),
               ContactProjectionError);
}

TEST(PressureIntegratorTest, IndexOutOfRange_Throws)
{
  PressureIntegrator const integrator;
  TetrahedralMesh const mesh = unitTetrahedronMesh({1.0, 1.0, 1.0, 1.0});

  EXPECT_THROW(static_cast<void>(integrator.integrate(mesh, 1, planeAtX(0.5))),
               std::out_of_range);
}

TEST(PressureIntegratorTest, FlatTetrahedron_ThrowsInvalidArgument)
{
  PressureIntegrator const integrator;
  TetrahedralMesh const mesh{{Coordinate{-1.0, 0.0, 0.0},
                              Coordinate{1.0, 0.0, 0.0},
                              Coordinate{0.0, 1.0, 0.0},
                              Coordinate{0.5, 0.5, 0.0}},
                             {TetrahedronIndices{0, 1, 2, 3}},
                             {1.0, 1.0, 1.0, 1.0}};

  EXPECT_THROW(static_cast<void>(integrator.integrate(mesh, 0, planeAtX(0.0))),
               std::invalid_argument);
}
