#include "hydro-sim/src/Physics/Hydroelastic/ContactResult.hpp"

namespace hydro_sim
{

std::vector<double> ContactDetails::forces(const ContributionMap& body)
{
  std::vector<double> result;
  result.reserve(body.size());
  for (const auto& [index, contribution] : body)
  {
    result.push_back(contribution.force);
  }
  return result;
}

std::vector<Coordinate> ContactDetails::centroids(const ContributionMap& body)
{
  std::vector<Coordinate> result;
  result.reserve(body.size());
  for (const auto& [index, contribution] : body)
  {
    result.push_back(contribution.centroid);
  }
  return result;
}

std::vector<std::vector<Coordinate>> ContactDetails::polygons(
  const ContributionMap& body)
{
  std::vector<std::vector<Coordinate>> result;
  result.reserve(body.size());
  for (const auto& [index, contribution] : body)
  {
    result.push_back(contribution.polygon);
  }
  return result;
}

}  // namespace hydro_sim
