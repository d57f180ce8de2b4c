#include <gtest/gtest.h>
#include <cmath>
#include <numeric>

#include "hydro-sim/src/Environment/ReferenceFrame.hpp"
#include "hydro-sim/src/Physics/Hydroelastic/ContactForceSolver.hpp"
#include "hydro-sim/src/Utils/TetrahedralMeshFactory.hpp"

using namespace hydro_sim;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

// Unit cubes with potential 1, the second shifted along x so the two
// overlap by 'overlap'
struct CubePair
{
  TetrahedralMesh first;
  TetrahedralMesh second;
};

CubePair overlappingCubes(double overlap)
{
  return CubePair{
    TetrahedralMeshFactory::createCube(1.0, 1.0),
    TetrahedralMeshFactory::createCube(
      1.0, 1.0, ReferenceFrame{Coordinate{1.0 - overlap, 0.0, 0.0}})};
}

double sum(const std::vector<double>& values)
{
  return std::accumulate(values.begin(), values.end(), 0.0);
}

}  // anonymous namespace

// ============================================================================
// No Contact
// ============================================================================

TEST(ContactForceSolverTest, SeparatedMeshes_NoContact)
{
  ContactForceSolver const solver;
  TetrahedralMesh const a = TetrahedralMeshFactory::createCube(1.0, 1.0);
  TetrahedralMesh const b = TetrahedralMeshFactory::createCube(
    1.0, 1.0, ReferenceFrame{Coordinate{3.0, 0.0, 0.0}});

  HydroelasticContact const contact = solver.computeContact(a, b, true);

  EXPECT_FALSE(contact.intersects);
  EXPECT_TRUE(contact.wrench12.toVector().isZero());
  EXPECT_TRUE(contact.wrench21.toVector().isZero());
  EXPECT_FALSE(contact.details.has_value());
}

// ============================================================================
// Overlapping Cubes
// ============================================================================

TEST(ContactForceSolverTest, OverlappingCubes_EqualAndOppositeForces)
{
  ContactForceSolver const solver;
  auto const cubes = overlappingCubes(0.1);

  HydroelasticContact const contact = solver.computeContact(cubes.first, cubes.second);

  ASSERT_TRUE(contact.intersects);
  EXPECT_NEAR(contact.depth, 0.1, 1e-6);
  EXPECT_NEAR(contact.planeNormal.x(), 1.0, 1e-6);
  EXPECT_NEAR(contact.planePoint.x(), 0.45, 1e-6);

  // Cross-section area 1 at uniform pressure 1
  EXPECT_NEAR(contact.wrench12.force.x(), 1.0, 1e-6);
  EXPECT_NEAR(contact.wrench12.force.y(), 0.0, 1e-9);
  EXPECT_NEAR(contact.wrench12.force.z(), 0.0, 1e-9);
  EXPECT_NEAR(contact.wrench21.force.x(), -1.0, 1e-6);
  EXPECT_TRUE(contact.wrench12.torque.isZero());
  EXPECT_TRUE(contact.wrench21.torque.isZero());
  EXPECT_FALSE(contact.details.has_value());
}

TEST(ContactForceSolverTest, SwappedMeshes_ForcesSwap)
{
  ContactForceSolver const solver;
  auto const cubes = overlappingCubes(0.1);

  HydroelasticContact const forward = solver.computeContact(cubes.first, cubes.second);
  HydroelasticContact const backward =
    solver.computeContact(cubes.second, cubes.first);

  ASSERT_TRUE(backward.intersects);
  EXPECT_NEAR(backward.planeNormal.x(), -1.0, 1e-6);
  EXPECT_NEAR(backward.wrench12.force.x(), forward.wrench21.force.x(), 1e-6);
  EXPECT_NEAR(backward.wrench21.force.x(), forward.wrench12.force.x(), 1e-6);
}

TEST(ContactForceSolverTest, Details_SumToForceMagnitude)
{
  ContactForceSolver const solver;
  auto const cubes = overlappingCubes(0.1);

  HydroelasticContact const contact =
    solver.computeContact(cubes.first, cubes.second, true);

  ASSERT_TRUE(contact.details.has_value());
  const ContactDetails& details = *contact.details;

  // Every Kuhn tetrahedron contains the long diagonal, so all six are cut
  EXPECT_EQ(details.body1.size(), 6u);
  EXPECT_EQ(details.body2.size(), 6u);
  EXPECT_NEAR(sum(ContactDetails::forces(details.body1)),
              contact.wrench12.force.norm(),
              1e-9);
  EXPECT_NEAR(sum(ContactDetails::forces(details.body2)),
              contact.wrench21.force.norm(),
              1e-9);

  // Polygons lie on the contact plane, in mesh 2's frame (x = -0.45)
  for (const auto& polygon : ContactDetails::polygons(details.body1))
  {
    ASSERT_GE(polygon.size(), 3u);
    for (const auto& point : polygon)
    {
      EXPECT_NEAR(point.x(), -0.45, 1e-6);
    }
  }
  EXPECT_EQ(ContactDetails::centroids(details.body2).size(), 6u);
}

TEST(ContactForceSolverTest, UnsortedPolygons_SameForce)
{
  ContactConfig config;
  config.sortPolygonVertices = false;
  ContactForceSolver const unsorted{config};
  ContactForceSolver const sorted;
  auto const cubes = overlappingCubes(0.2);

  HydroelasticContact const a = unsorted.computeContact(cubes.first, cubes.second);
  HydroelasticContact const b = sorted.computeContact(cubes.first, cubes.second);

  ASSERT_TRUE(a.intersects);
  EXPECT_FALSE(unsorted.getConfig().sortPolygonVertices);
  EXPECT_NEAR(a.wrench12.force.x(), b.wrench12.force.x(), 1e-9);
  EXPECT_NEAR(a.wrench21.force.x(), b.wrench21.force.x(), 1e-9);
}

TEST(ContactForceSolverTest, RawEPAPenetration_SameContact)
{
  ContactConfig config;
  config.validatePenetrationWithSAT = false;
  ContactForceSolver const solver{config};
  auto const cubes = overlappingCubes(0.1);

  HydroelasticContact const contact = solver.computeContact(cubes.first, cubes.second);

  ASSERT_TRUE(contact.intersects);
  EXPECT_NEAR(contact.depth, 0.1, 1e-6);
  EXPECT_NEAR(contact.wrench12.force.x(), 1.0, 1e-6);
}

TEST(ContactForceSolverTest, CandidateCap_LimitsContributions)
{
  ContactConfig config;
  config.maxBroadPhaseCandidates = 1;
  ContactForceSolver const solver{config};
  auto const cubes = overlappingCubes(0.1);

  HydroelasticContact const contact =
    solver.computeContact(cubes.first, cubes.second, true);

  ASSERT_TRUE(contact.intersects);
  ASSERT_TRUE(contact.details.has_value());
  EXPECT_LE(contact.details->body1.size(), 1u);
  EXPECT_LE(contact.details->body2.size(), 1u);
  EXPECT_LT(contact.wrench12.force.norm(), 1.0);
}

// ============================================================================
// Frame Handling
// ============================================================================

TEST(ContactForceSolverTest, RotatedPair_ForceFollowsRotation)
{
  // The same configuration as OverlappingCubes, rigidly rotated and moved
  Eigen::Matrix3d const rotation =
    Eigen::AngleAxisd{0.8, Eigen::Vector3d{1.0, -2.0, 0.5}.normalized()}
      .toRotationMatrix();
  Coordinate const origin{2.0, -1.0, 0.5};

  TetrahedralMesh const a =
    TetrahedralMeshFactory::createCube(1.0, 1.0, ReferenceFrame{origin, rotation});
  TetrahedralMesh const b = TetrahedralMeshFactory::createCube(
    1.0,
    1.0,
    ReferenceFrame{Coordinate{origin + rotation * Eigen::Vector3d{0.9, 0.0, 0.0}},
                   rotation});

  ContactForceSolver const solver;
  HydroelasticContact const contact = solver.computeContact(a, b);

  ASSERT_TRUE(contact.intersects);
  Eigen::Vector3d const expectedNormal = rotation * Eigen::Vector3d::UnitX();
  EXPECT_NEAR(contact.planeNormal.dot(expectedNormal), 1.0, 1e-6);
  EXPECT_NEAR(contact.wrench12.force.norm(), 1.0, 1e-6);
  EXPECT_NEAR(contact.wrench12.force.dot(expectedNormal), 1.0, 1e-6);
  EXPECT_NEAR((contact.wrench12.force + contact.wrench21.force).norm(), 0.0, 1e-6);

  Coordinate const expectedPoint{origin + rotation * Eigen::Vector3d{0.45, 0.0, 0.0}};
  EXPECT_NEAR((contact.planePoint - expectedPoint).norm(), 0.0, 1e-6);
}

// ============================================================================
// Subdivided Meshes
// ============================================================================

TEST(ContactForceSolverTest, SubdividedCubes_PressureRisesWithDepth)
{
  ContactForceSolver const solver;
  TetrahedralMesh const a = TetrahedralMeshFactory::createSubdividedCube(1.0, 4, 10.0);
  TetrahedralMesh const shallowB = TetrahedralMeshFactory::createSubdividedCube(
    1.0, 4, 10.0, ReferenceFrame{Coordinate{0.95, 0.0, 0.0}});
  TetrahedralMesh const deepB = TetrahedralMeshFactory::createSubdividedCube(
    1.0, 4, 10.0, ReferenceFrame{Coordinate{0.7, 0.0, 0.0}});

  HydroelasticContact const shallow = solver.computeContact(a, shallowB);
  HydroelasticContact const deep = solver.computeContact(a, deepB);

  ASSERT_TRUE(shallow.intersects);
  ASSERT_TRUE(deep.intersects);
  EXPECT_GT(shallow.wrench12.force.x(), 0.0);
  EXPECT_LT(shallow.wrench21.force.x(), 0.0);
  EXPECT_NEAR(shallow.wrench12.force.y(), 0.0, 1e-9);
  EXPECT_NEAR(shallow.wrench12.force.z(), 0.0, 1e-9);
  EXPECT_GT(deep.wrench12.force.x(), shallow.wrench12.force.x());
}
