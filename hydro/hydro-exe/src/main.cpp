#include <cstdlib>
#include <format>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "hydro-sim/src/Environment/ReferenceFrame.hpp"
#include "hydro-sim/src/Physics/Hydroelastic/ContactForceSolver.hpp"
#include "hydro-sim/src/Utils/TetrahedralMeshFactory.hpp"

namespace
{

double parseOverlap(int argc, char** argv)
{
  if (argc < 2)
  {
    return 0.1;
  }

  std::string const argument{argv[1]};
  size_t consumed = 0;
  double const overlap = std::stod(argument, &consumed);
  if (consumed != argument.size())
  {
    throw std::invalid_argument(
      std::format("trailing characters in overlap '{}'", argument));
  }
  return overlap;
}

}  // namespace

int main(int argc, char** argv)
{
  double overlap = 0.0;
  try
  {
    overlap = parseOverlap(argc, argv);
  }
  catch (const std::logic_error& e)
  {
    // std::stod reports bad input as invalid_argument or out_of_range
    spdlog::error("Usage: {} [overlap]: {}", argv[0], e.what());
    return EXIT_FAILURE;
  }

  using namespace hydro_sim;

  // Two unit cubes along x, overlapping by `overlap`
  TetrahedralMesh const cube1 = TetrahedralMeshFactory::createCube(1.0, 1.0);
  TetrahedralMesh const cube2 = TetrahedralMeshFactory::createCube(
    1.0, 1.0, ReferenceFrame{Coordinate{1.0 - overlap, 0.0, 0.0}});

  ContactForceSolver const solver;
  HydroelasticContact const contact =
    solver.computeContact(cube1, cube2, true);

  spdlog::info("Overlap {:.4f}: intersects = {}", overlap, contact.intersects);
  if (!contact.intersects)
  {
    return EXIT_SUCCESS;
  }

  spdlog::info("Depth {:.6f}, plane point {}, plane normal {}",
               contact.depth,
               std::format("{}", contact.planePoint),
               std::format("{}", contact.planeNormal));
  spdlog::info("Force of body 1 on body 2: {}",
               std::format("{}", contact.wrench12.force));
  spdlog::info("Force of body 2 on body 1: {}",
               std::format("{}", contact.wrench21.force));
  spdlog::info("Contributing tetrahedra: {} on body 1, {} on body 2",
               contact.details->body1.size(),
               contact.details->body2.size());

  return EXIT_SUCCESS;
}
