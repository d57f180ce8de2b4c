#ifndef HYDRO_SIM_ENVIRONMENT_REFERENCE_FRAME_HPP
#define HYDRO_SIM_ENVIRONMENT_REFERENCE_FRAME_HPP

#include <Eigen/Dense>
#include <Eigen/Geometry>

#include "hydro-sim/src/DataTypes/Coordinate.hpp"
#include "hydro-sim/src/DataTypes/Vector3D.hpp"

namespace hydro_sim
{

/**
 * @brief Rigid transform from a local (body/mesh) frame to the global frame.
 *
 * The frame is an orthonormal rotation followed by a translation:
 *
 *   p_global = R * p_local + origin
 *
 * Points use the absolute transforms (rotation and translation); direction
 * vectors use the relative transforms (rotation only).
 */
class ReferenceFrame
{
public:
  /// Tolerance used to validate that a rotation matrix is orthonormal
  static constexpr double kOrthonormalTolerance = 1e-9;

  /**
   * @brief Default constructor - identity frame at the global origin
   */
  ReferenceFrame();

  /**
   * @brief Constructor with translation only
   * @param origin The origin of this frame in global coordinates
   */
  explicit ReferenceFrame(const Coordinate& origin);

  /**
   * @brief Constructor with translation and rotation matrix
   * @param origin The origin of this frame in global coordinates
   * @param rotation Local-to-global rotation
   * @throws std::invalid_argument if rotation is not orthonormal with
   *         determinant +1
   */
  ReferenceFrame(const Coordinate& origin, const Eigen::Matrix3d& rotation);

  /**
   * @brief Constructor with translation and rotation quaternion
   *
   * The quaternion is normalized before use.
   *
   * @throws std::invalid_argument if the quaternion has zero norm
   */
  ReferenceFrame(const Coordinate& origin, const Eigen::Quaterniond& rotation);

  /**
   * @brief Transform a point from this local frame to the global frame
   */
  [[nodiscard]] Coordinate localToGlobal(const Coordinate& localPoint) const;

  /**
   * @brief Transform a point from the global frame to this local frame
   */
  [[nodiscard]] Coordinate globalToLocal(const Coordinate& globalPoint) const;

  /**
   * @brief Rotate a direction from this local frame to the global frame
   */
  [[nodiscard]] Vector3D localToGlobalRelative(
    const Vector3D& localVector) const;

  /**
   * @brief Rotate a direction from the global frame to this local frame
   */
  [[nodiscard]] Vector3D globalToLocalRelative(
    const Vector3D& globalVector) const;

  /**
   * @brief Batch transform points (one per column) from local to global,
   * in place.
   */
  void localToGlobalBatch(Eigen::Matrix3Xd& localPoints) const;

  /**
   * @brief Batch transform points (one per column) from global to local,
   * in place.
   */
  void globalToLocalBatch(Eigen::Matrix3Xd& globalPoints) const;

  /**
   * @brief Express this frame relative to another frame.
   *
   * The returned frame maps coordinates local to this frame into coordinates
   * local to @p other:
   *
   *   other.globalToLocal(localToGlobal(p)) == relativeTo(other).localToGlobal(p)
   *
   * @param other Target frame
   * @return Frame of this expressed in other's local coordinates
   */
  [[nodiscard]] ReferenceFrame relativeTo(const ReferenceFrame& other) const;

  [[nodiscard]] const Coordinate& getOrigin() const
  {
    return origin_;
  }

  [[nodiscard]] const Eigen::Matrix3d& getRotation() const
  {
    return rotation_;
  }

  void setOrigin(const Coordinate& origin);

  /**
   * @throws std::invalid_argument if rotation is not a proper rotation
   */
  void setRotation(const Eigen::Matrix3d& rotation);

private:
  static void validateRotation(const Eigen::Matrix3d& rotation);

  Coordinate origin_;         ///< Origin of this frame in global coordinates
  Eigen::Matrix3d rotation_;  ///< Local-to-global rotation
};

}  // namespace hydro_sim

#endif  // HYDRO_SIM_ENVIRONMENT_REFERENCE_FRAME_HPP
