#ifndef HYDRO_SIM_PHYSICS_CONTACT_RESULT_HPP
#define HYDRO_SIM_PHYSICS_CONTACT_RESULT_HPP

#include <Eigen/Dense>
#include <map>
#include <optional>
#include <vector>

#include "hydro-sim/src/DataTypes/Coordinate.hpp"
#include "hydro-sim/src/DataTypes/Vector3D.hpp"

namespace hydro_sim
{

/**
 * @brief Force and torque acting on a body, world frame.
 */
struct Wrench
{
  Vector3D force{0.0, 0.0, 0.0};   // [N]
  Vector3D torque{0.0, 0.0, 0.0};  // [N*m]

  /// [force; torque]
  [[nodiscard]] Eigen::Matrix<double, 6, 1> toVector() const
  {
    Eigen::Matrix<double, 6, 1> result;
    result << force, torque;
    return result;
  }
};

/**
 * @brief Contribution of one tetrahedron to the contact force.
 *
 * Positions are expressed in the frame of the second body's mesh, where the
 * contact is computed.
 */
struct TetrahedronContribution
{
  double area{0.0};                 // Area of the contact polygon [m^2]
  double pressure{0.0};             // Potential interpolated at the centroid
  double force{0.0};                // area * pressure
  Coordinate centroid;              // Mean of the polygon points
  std::vector<Coordinate> polygon;  // 3 or 4 points on the contact plane
};

using ContributionMap = std::map<size_t, TetrahedronContribution>;

/**
 * @brief Per-tetrahedron diagnostics of a contact, keyed by tetrahedron index.
 */
struct ContactDetails
{
  ContributionMap body1;
  ContributionMap body2;

  /// Force magnitudes in tetrahedron index order
  [[nodiscard]] static std::vector<double> forces(const ContributionMap& body);

  /// Polygon centroids in tetrahedron index order
  [[nodiscard]] static std::vector<Coordinate> centroids(
    const ContributionMap& body);

  /// Contact polygons in tetrahedron index order
  [[nodiscard]] static std::vector<std::vector<Coordinate>> polygons(
    const ContributionMap& body);
};

/**
 * @brief Result of a hydroelastic contact computation.
 *
 * wrench12 is exerted by the first body on the second (along +planeNormal),
 * wrench21 by the second body on the first. Torques are not computed and
 * stay zero. When intersects is false both wrenches are zero and no details
 * are attached.
 */
struct HydroelasticContact
{
  bool intersects{false};
  double depth{0.0};       // Penetration depth of the two meshes' hulls
  Coordinate planePoint;   // Contact plane point, world frame
  Vector3D planeNormal;    // Contact plane normal, world frame
  Wrench wrench12;
  Wrench wrench21;
  std::optional<ContactDetails> details;
};

}  // namespace hydro_sim

#endif  // HYDRO_SIM_PHYSICS_CONTACT_RESULT_HPP
