#include <gtest/gtest.h>
#include <cmath>
#include <vector>

#include "hydro-sim/src/Geometry/Distance.hpp"
#include "hydro-sim/src/Geometry/Primitives.hpp"

using namespace hydro_sim;

namespace
{

constexpr double kTolerance = 1e-9;

void expectCoordinateNear(const Coordinate& actual,
                          const Coordinate& expected,
                          double tolerance = kTolerance)
{
  EXPECT_NEAR(actual.x(), expected.x(), tolerance);
  EXPECT_NEAR(actual.y(), expected.y(), tolerance);
  EXPECT_NEAR(actual.z(), expected.z(), tolerance);
}

const Vector3D kUnitX{1.0, 0.0, 0.0};
const Vector3D kUnitY{0.0, 1.0, 0.0};
const Vector3D kUnitZ{0.0, 0.0, 1.0};

}  // anonymous namespace

// ============================================================================
// Point queries
// ============================================================================

TEST(DistanceTest, PointToPoint_EuclideanDistance)
{
  auto const result =
    distance::pointToPoint(Coordinate{0.0, 0.0, 0.0}, Coordinate{3.0, 4.0, 0.0});
  EXPECT_NEAR(result.distance, 5.0, kTolerance);
}

TEST(DistanceTest, PointToLine_ProjectsOntoLine)
{
  auto const result = distance::pointToLine(
    Coordinate{1.0, 2.0, 0.0}, Coordinate{0.0, 0.0, 0.0}, kUnitX);

  EXPECT_NEAR(result.distance, 2.0, kTolerance);
  EXPECT_NEAR(result.parameter, 1.0, kTolerance);
  expectCoordinateNear(result.closestPoint, Coordinate{1.0, 0.0, 0.0});
}

TEST(DistanceTest, PointToLineSegment_InteriorProjection)
{
  auto const result = distance::pointToLineSegment(Coordinate{0.5, 3.0, 0.0},
                                                   Coordinate{0.0, 0.0, 0.0},
                                                   Coordinate{1.0, 0.0, 0.0});

  EXPECT_NEAR(result.distance, 3.0, kTolerance);
  EXPECT_NEAR(result.parameter, 0.5, kTolerance);
  expectCoordinateNear(result.closestPoint, Coordinate{0.5, 0.0, 0.0});
}

TEST(DistanceTest, PointToLineSegment_OutsideParameter_ClampsToEndpoint)
{
  Coordinate const start{0.0, 0.0, 0.0};
  Coordinate const end{1.0, 0.0, 0.0};

  auto const beyondEnd =
    distance::pointToLineSegment(Coordinate{2.0, 1.0, 0.0}, start, end);
  EXPECT_NEAR(beyondEnd.parameter, 1.0, kTolerance);
  EXPECT_NEAR(beyondEnd.distance,
              distance::pointToPoint(Coordinate{2.0, 1.0, 0.0}, end).distance,
              kTolerance);
  expectCoordinateNear(beyondEnd.closestPoint, end);

  auto const beforeStart =
    distance::pointToLineSegment(Coordinate{-1.0, 0.0, 0.0}, start, end);
  EXPECT_NEAR(beforeStart.parameter, 0.0, kTolerance);
  EXPECT_NEAR(beforeStart.distance, 1.0, kTolerance);
  expectCoordinateNear(beforeStart.closestPoint, start);
}

TEST(DistanceTest, PointToLineSegment_PointsOnSegment_ZeroDistance)
{
  Coordinate const start{-1.0, 2.0, 0.5};
  Coordinate const end{3.0, -1.0, 2.5};

  for (int i = 0; i <= 10; ++i)
  {
    double const t = i / 10.0;
    Coordinate const onSegment{start + t * (end - start)};
    auto const result = distance::pointToLineSegment(onSegment, start, end);
    EXPECT_NEAR(result.distance, 0.0, 1e-10);
    expectCoordinateNear(result.closestPoint, onSegment, 1e-10);
  }
}

TEST(DistanceTest, PointToLineSegment_DegenerateSegment_DistanceToStart)
{
  Coordinate const start{1.0, 1.0, 1.0};
  auto const result =
    distance::pointToLineSegment(Coordinate{1.0, 1.0, 3.0}, start, start);

  EXPECT_FALSE(std::isnan(result.distance));
  EXPECT_NEAR(result.distance, 2.0, kTolerance);
  EXPECT_NEAR(result.parameter, 0.0, kTolerance);
  expectCoordinateNear(result.closestPoint, start);
}

TEST(DistanceTest, PointToPlane_SignedAndUnsigned)
{
  Coordinate const origin{0.0, 0.0, 0.0};
  Coordinate const below{1.0, 2.0, -3.0};
  Coordinate const above{1.0, 2.0, 3.0};

  auto const signedBelow = distance::pointToPlane(below, origin, kUnitZ, true);
  auto const signedAbove = distance::pointToPlane(above, origin, kUnitZ, true);
  auto const unsignedBelow = distance::pointToPlane(below, origin, kUnitZ);

  EXPECT_NEAR(signedBelow.distance, -3.0, kTolerance);
  EXPECT_NEAR(signedAbove.distance, 3.0, kTolerance);
  EXPECT_NEAR(unsignedBelow.distance, std::abs(signedBelow.distance), kTolerance);
  expectCoordinateNear(signedBelow.closestPoint, Coordinate{1.0, 2.0, 0.0});
}

TEST(DistanceTest, PointsToPlaneSigned_MatchesSingleQueries)
{
  std::vector<Coordinate> const points{Coordinate{0.0, 0.0, -1.0},
                                       Coordinate{2.0, 1.0, 0.5},
                                       Coordinate{-3.0, 4.0, 0.0}};
  Coordinate const planePoint{0.0, 0.0, 0.25};
  Vector3D const normal{Vector3D{1.0, 0.0, 1.0}.normalized()};

  Eigen::VectorXd const distances =
    distance::pointsToPlaneSigned(points, planePoint, normal);

  ASSERT_EQ(distances.size(), 3);
  for (size_t i = 0; i < points.size(); ++i)
  {
    EXPECT_NEAR(distances(static_cast<Eigen::Index>(i)),
                distance::pointToPlane(points[i], planePoint, normal, true).distance,
                kTolerance);
  }
}

// ============================================================================
// Line and segment queries
// ============================================================================

TEST(DistanceTest, LineToLine_SkewLines)
{
  auto const result = distance::lineToLine(
    Coordinate{0.0, 0.0, 0.0}, kUnitX, Coordinate{2.0, 3.0, 1.0}, kUnitY);

  EXPECT_NEAR(result.distance, 1.0, kTolerance);
  EXPECT_NEAR(result.parameter1, 2.0, kTolerance);
  EXPECT_NEAR(result.parameter2, -3.0, kTolerance);
  expectCoordinateNear(result.closestPoint1, Coordinate{2.0, 0.0, 0.0});
  expectCoordinateNear(result.closestPoint2, Coordinate{2.0, 0.0, 1.0});
}

TEST(DistanceTest, LineToLine_Parallel_UsesSecondAnchor)
{
  Coordinate const anchor2{5.0, 2.0, 0.0};
  auto const result =
    distance::lineToLine(Coordinate{0.0, 0.0, 0.0}, kUnitX, anchor2, kUnitX);

  EXPECT_NEAR(result.distance, 2.0, kTolerance);
  expectCoordinateNear(result.closestPoint2, anchor2);
  expectCoordinateNear(result.closestPoint1, Coordinate{5.0, 0.0, 0.0});
}

TEST(DistanceTest, LineToLine_NearlyParallel_TakesParallelBranch)
{
  Coordinate const point1{0.0, 0.0, 0.0};
  Coordinate const point2{5.0, 2.0, 0.0};
  Vector3D const tilted{Vector3D{1.0, 1e-5, 0.0}.normalized()};

  auto const result = distance::lineToLine(point1, kUnitX, point2, tilted);

  // Parallel fallback: closest point 2 is the anchor, distance is the
  // point-to-line distance from the anchor to line 1
  expectCoordinateNear(result.closestPoint2, point2);
  EXPECT_NEAR(result.distance,
              distance::pointToLine(point2, point1, kUnitX).distance,
              kTolerance);
}

TEST(DistanceTest, LineToLineSegment_InteriorAndClamped)
{
  Coordinate const linePoint{0.0, 0.0, 0.0};

  auto const interior = distance::lineToLineSegment(
    linePoint, kUnitX, Coordinate{2.0, -1.0, 1.0}, Coordinate{2.0, 1.0, 1.0});
  EXPECT_NEAR(interior.distance, 1.0, kTolerance);
  EXPECT_NEAR(interior.parameter1, 2.0, kTolerance);
  EXPECT_NEAR(interior.parameter2, 0.5, kTolerance);
  expectCoordinateNear(interior.closestPoint1, Coordinate{2.0, 0.0, 0.0});
  expectCoordinateNear(interior.closestPoint2, Coordinate{2.0, 0.0, 1.0});

  auto const clamped = distance::lineToLineSegment(
    linePoint, kUnitX, Coordinate{2.0, 1.0, 1.0}, Coordinate{2.0, 3.0, 1.0});
  EXPECT_NEAR(clamped.distance, std::sqrt(2.0), kTolerance);
  EXPECT_NEAR(clamped.parameter2, 0.0, kTolerance);
  expectCoordinateNear(clamped.closestPoint2, Coordinate{2.0, 1.0, 1.0});
}

TEST(DistanceTest, SegmentToSegment_Crossing)
{
  auto const result =
    distance::lineSegmentToLineSegment(Coordinate{-1.0, 0.0, 0.0},
                                       Coordinate{1.0, 0.0, 0.0},
                                       Coordinate{0.0, -1.0, 1.0},
                                       Coordinate{0.0, 1.0, 1.0});

  EXPECT_NEAR(result.distance, 1.0, kTolerance);
  EXPECT_NEAR(result.parameter1, 0.5, kTolerance);
  EXPECT_NEAR(result.parameter2, 0.5, kTolerance);
}

TEST(DistanceTest, SegmentToSegment_ParallelOverlapping)
{
  auto const result =
    distance::lineSegmentToLineSegment(Coordinate{0.0, 0.0, 0.0},
                                       Coordinate{2.0, 0.0, 0.0},
                                       Coordinate{1.0, 1.0, 0.0},
                                       Coordinate{3.0, 1.0, 0.0});

  EXPECT_NEAR(result.distance, 1.0, kTolerance);
  EXPECT_GE(result.parameter1, 0.0);
  EXPECT_LE(result.parameter1, 1.0);
  EXPECT_GE(result.parameter2, 0.0);
  EXPECT_LE(result.parameter2, 1.0);
}

TEST(DistanceTest, SegmentToSegment_SecondParameterOutOfRange_Reprojects)
{
  auto const result =
    distance::lineSegmentToLineSegment(Coordinate{0.0, 0.0, 0.0},
                                       Coordinate{1.0, 0.0, 0.0},
                                       Coordinate{2.0, 1.0, 0.0},
                                       Coordinate{3.0, 1.0, 0.0});

  EXPECT_NEAR(result.distance, std::sqrt(2.0), kTolerance);
  expectCoordinateNear(result.closestPoint1, Coordinate{1.0, 0.0, 0.0});
  expectCoordinateNear(result.closestPoint2, Coordinate{2.0, 1.0, 0.0});
}

TEST(DistanceTest, SegmentToSegment_BothDegenerate_PointDistance)
{
  Coordinate const a{0.0, 0.0, 0.0};
  Coordinate const b{0.0, 3.0, 4.0};
  auto const result = distance::lineSegmentToLineSegment(a, a, b, b);

  EXPECT_NEAR(result.distance, 5.0, kTolerance);
  expectCoordinateNear(result.closestPoint1, a);
  expectCoordinateNear(result.closestPoint2, b);
}

TEST(DistanceTest, SegmentToSegment_ReversedArguments_SameDistanceSwappedPoints)
{
  Coordinate const a0{-0.3, 0.2, 1.1};
  Coordinate const a1{1.7, -0.4, 0.2};
  Coordinate const b0{0.5, 1.5, -0.8};
  Coordinate const b1{0.9, -2.0, 0.6};

  auto const forward = distance::lineSegmentToLineSegment(a0, a1, b0, b1);
  auto const backward = distance::lineSegmentToLineSegment(b0, b1, a0, a1);

  EXPECT_NEAR(forward.distance, backward.distance, 1e-9);
  expectCoordinateNear(forward.closestPoint1, backward.closestPoint2, 1e-9);
  expectCoordinateNear(forward.closestPoint2, backward.closestPoint1, 1e-9);
}

// ============================================================================
// Plane queries
// ============================================================================

TEST(DistanceTest, LineToPlane_IntersectingAndParallel)
{
  Coordinate const origin{0.0, 0.0, 0.0};

  auto const crossing =
    distance::lineToPlane(Coordinate{1.0, 1.0, 1.0}, kUnitZ, origin, kUnitZ);
  EXPECT_NEAR(crossing.distance, 0.0, kTolerance);
  EXPECT_NEAR(crossing.parameter1, -1.0, kTolerance);
  expectCoordinateNear(crossing.closestPoint1, Coordinate{1.0, 1.0, 0.0});

  auto const parallel =
    distance::lineToPlane(Coordinate{0.0, 0.0, 2.0}, kUnitX, origin, kUnitZ);
  EXPECT_NEAR(parallel.distance, 2.0, kTolerance);
  expectCoordinateNear(parallel.closestPoint2, origin);
}

TEST(DistanceTest, SegmentToPlane_Crossing_InterpolatesIntersection)
{
  auto const result = distance::lineSegmentToPlane(Coordinate{0.0, 0.0, -1.0},
                                                   Coordinate{0.0, 0.0, 3.0},
                                                   Coordinate{0.0, 0.0, 0.0},
                                                   kUnitZ);

  EXPECT_NEAR(result.distance, 0.0, kTolerance);
  EXPECT_NEAR(result.parameter, 0.25, kTolerance);
  EXPECT_NEAR(result.signedDistanceStart, -1.0, kTolerance);
  EXPECT_NEAR(result.signedDistanceEnd, 3.0, kTolerance);
  expectCoordinateNear(result.closestPointSegment, Coordinate{0.0, 0.0, 0.0});
}

TEST(DistanceTest, SegmentToPlane_SameSide_NearestEndpoint)
{
  Coordinate const origin{0.0, 0.0, 0.0};

  auto const startNearer = distance::lineSegmentToPlane(
    Coordinate{0.0, 0.0, 1.0}, Coordinate{0.0, 0.0, 3.0}, origin, kUnitZ);
  EXPECT_NEAR(startNearer.distance, 1.0, kTolerance);
  EXPECT_NEAR(startNearer.parameter, 0.0, kTolerance);
  expectCoordinateNear(startNearer.closestPointPlane, origin);

  auto const endNearer = distance::lineSegmentToPlane(
    Coordinate{2.0, 0.0, -3.0}, Coordinate{2.0, 0.0, -1.0}, origin, kUnitZ);
  EXPECT_NEAR(endNearer.distance, 1.0, kTolerance);
  EXPECT_NEAR(endNearer.parameter, 1.0, kTolerance);
  expectCoordinateNear(endNearer.closestPointPlane, Coordinate{2.0, 0.0, 0.0});
}

TEST(DistanceTest, SegmentToPlane_EndpointOnPlane_ZeroDistance)
{
  auto const result = distance::lineSegmentToPlane(Coordinate{0.0, 0.0, 0.0},
                                                   Coordinate{0.0, 0.0, 2.0},
                                                   Coordinate{0.0, 0.0, 0.0},
                                                   kUnitZ);

  EXPECT_NEAR(result.distance, 0.0, kTolerance);
  EXPECT_NEAR(result.parameter, 0.0, kTolerance);
}

TEST(DistanceTest, PlaneToPlane_ParallelAndIntersecting)
{
  auto const parallel = distance::planeToPlane(Coordinate{0.0, 0.0, 0.0},
                                               kUnitZ,
                                               Coordinate{1.0, 1.0, 3.0},
                                               kUnitZ);
  EXPECT_NEAR(parallel.distance, 3.0, kTolerance);

  auto const crossing = distance::planeToPlane(Coordinate{0.0, 0.0, 0.0},
                                               kUnitZ,
                                               Coordinate{1.0, 0.0, 0.0},
                                               kUnitX);
  EXPECT_NEAR(crossing.distance, 0.0, kTolerance);
  expectCoordinateNear(crossing.closestPoint1, Coordinate{1.0, 0.0, 0.0});
}

// ============================================================================
// Primitive dispatch
// ============================================================================

TEST(DistanceTest, Dispatch_MatchesDirectRoutine)
{
  Primitive const point{Point{Coordinate{2.0, 1.0, 0.0}}};
  Primitive const segment{
    Segment{Coordinate{0.0, 0.0, 0.0}, Coordinate{1.0, 0.0, 0.0}}};

  auto const dispatched = computeDistance(point, segment);
  auto const direct = distance::pointToLineSegment(Coordinate{2.0, 1.0, 0.0},
                                                   Coordinate{0.0, 0.0, 0.0},
                                                   Coordinate{1.0, 0.0, 0.0});

  EXPECT_NEAR(dispatched.distance, direct.distance, kTolerance);
  expectCoordinateNear(dispatched.closestPoint2, direct.closestPoint);
}

TEST(DistanceTest, Dispatch_EveryPairIsSymmetric)
{
  std::vector<Primitive> const primitives{
    Point{Coordinate{0.3, 0.7, 2.0}},
    Line{Coordinate{0.0, 0.0, -1.0}, Vector3D{Vector3D{1.0, 1.0, 0.0}.normalized()}},
    Segment{Coordinate{-1.0, 2.0, 0.5}, Coordinate{1.5, 2.5, -0.5}},
    Plane{Coordinate{0.0, 0.0, 4.0}, kUnitZ},
    Point{Coordinate{-2.0, 0.0, 1.0}},
    Line{Coordinate{1.0, -1.0, 0.0}, kUnitZ},
    Segment{Coordinate{3.0, 0.0, 0.0}, Coordinate{3.0, 1.0, 1.0}},
    Plane{Coordinate{0.0, 1.0, 0.0}, Vector3D{Vector3D{0.0, 1.0, 1.0}.normalized()}}};

  for (const auto& first : primitives)
  {
    for (const auto& second : primitives)
    {
      auto const forward = computeDistance(first, second);
      auto const backward = computeDistance(second, first);
      EXPECT_NEAR(forward.distance, backward.distance, 1e-9)
        << "primitive kinds " << first.index() << " and " << second.index();
      if (first.index() != second.index())
      {
        expectCoordinateNear(forward.closestPoint1, backward.closestPoint2);
        expectCoordinateNear(forward.closestPoint2, backward.closestPoint1);
      }
    }
  }
}

TEST(DistanceTest, Dispatch_SegmentPlane_ReversedSwapsPoints)
{
  Primitive const segment{
    Segment{Coordinate{0.0, 0.0, 1.0}, Coordinate{0.0, 0.0, 3.0}}};
  Primitive const plane{Plane{Coordinate{0.0, 0.0, 0.0}, kUnitZ}};

  auto const result = computeDistance(plane, segment);

  EXPECT_NEAR(result.distance, 1.0, kTolerance);
  expectCoordinateNear(result.closestPoint1, Coordinate{0.0, 0.0, 0.0});
  expectCoordinateNear(result.closestPoint2, Coordinate{0.0, 0.0, 1.0});
}
