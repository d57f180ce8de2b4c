#include "hydro-sim/src/Physics/Hydroelastic/NarrowPhase.hpp"

#include <optional>
#include <stdexcept>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "hydro-sim/src/Geometry/Distance.hpp"
#include "hydro-sim/src/Physics/Collision/GJK.hpp"
#include "hydro-sim/src/Physics/RigidBody/ConvexHull.hpp"

namespace hydro_sim
{

namespace
{

// Hull of each tetrahedron built on first use, nullopt when flat
class TetrahedronHullCache
{
public:
  explicit TetrahedronHullCache(const TetrahedralMesh& mesh) : mesh_{mesh}
  {
  }

  const std::optional<ConvexHull>& get(size_t index)
  {
    auto it = hulls_.find(index);
    if (it == hulls_.end())
    {
      it = hulls_.emplace(index, build(index)).first;
    }
    return it->second;
  }

private:
  std::optional<ConvexHull> build(size_t index) const
  {
    TetrahedronVertices const corners = mesh_.getTetrahedronVertices(index);
    try
    {
      return ConvexHull{corners};
    }
    catch (const std::runtime_error& e)
    {
      spdlog::debug("Tetrahedron {} has no 3D hull: {}", index, e.what());
      return std::nullopt;
    }
  }

  const TetrahedralMesh& mesh_;
  std::unordered_map<size_t, std::optional<ConvexHull>> hulls_;
};

}  // namespace

NarrowPhase::NarrowPhase(double epsilon, int maxIterations)
  : epsilon_{epsilon}, maxIterations_{maxIterations}
{
}

bool NarrowPhase::straddlesPlane(const Eigen::Vector4d& signedDistances)
{
  return signedDistances.minCoeff() < 0.0 && signedDistances.maxCoeff() >= 0.0;
}

std::vector<bool> NarrowPhase::straddlingTetrahedra(const TetrahedralMesh& mesh,
                                                    const Plane& plane)
{
  Eigen::VectorXd const vertexDistances = distance::pointsToPlaneSigned(
    mesh.getVertices(), plane.point, plane.normal);

  std::vector<bool> straddles;
  straddles.reserve(mesh.getTetrahedronCount());
  for (const auto& tetrahedron : mesh.getTetrahedra())
  {
    Eigen::Vector4d const d{
      vertexDistances(static_cast<Eigen::Index>(tetrahedron[0])),
      vertexDistances(static_cast<Eigen::Index>(tetrahedron[1])),
      vertexDistances(static_cast<Eigen::Index>(tetrahedron[2])),
      vertexDistances(static_cast<Eigen::Index>(tetrahedron[3]))};
    straddles.push_back(straddlesPlane(d));
  }
  return straddles;
}

std::vector<IndexPair> NarrowPhase::confirmPairs(
  const TetrahedralMesh& mesh1,
  const TetrahedralMesh& mesh2,
  std::span<const IndexPair> candidates,
  const Plane& plane) const
{
  std::vector<bool> const straddles1 = straddlingTetrahedra(mesh1, plane);
  std::vector<bool> const straddles2 = straddlingTetrahedra(mesh2, plane);

  TetrahedronHullCache hulls1{mesh1};
  TetrahedronHullCache hulls2{mesh2};

  std::vector<IndexPair> confirmed;
  for (const auto& [index1, index2] : candidates)
  {
    if (!straddles1.at(index1) || !straddles2.at(index2))
    {
      continue;
    }

    const auto& hull1 = hulls1.get(index1);
    const auto& hull2 = hulls2.get(index2);
    if (!hull1 || !hull2)
    {
      spdlog::warn(
        "Dropping tetrahedron pair ({}, {}): degenerate tetrahedron",
        index1,
        index2);
      continue;
    }

    if (gjkIntersects(*hull1, *hull2, epsilon_, maxIterations_))
    {
      confirmed.emplace_back(index1, index2);
    }
  }

  return confirmed;
}

}  // namespace hydro_sim
