#include "hydro-sim/src/Environment/ReferenceFrame.hpp"

#include <cmath>
#include <stdexcept>

namespace hydro_sim
{

ReferenceFrame::ReferenceFrame()
  : origin_{0.0, 0.0, 0.0}, rotation_{Eigen::Matrix3d::Identity()}
{
}

ReferenceFrame::ReferenceFrame(const Coordinate& origin)
  : origin_{origin}, rotation_{Eigen::Matrix3d::Identity()}
{
}

ReferenceFrame::ReferenceFrame(const Coordinate& origin,
                               const Eigen::Matrix3d& rotation)
  : origin_{origin}, rotation_{rotation}
{
  validateRotation(rotation_);
}

ReferenceFrame::ReferenceFrame(const Coordinate& origin,
                               const Eigen::Quaterniond& rotation)
  : origin_{origin}, rotation_{Eigen::Matrix3d::Identity()}
{
  if (rotation.norm() == 0.0)
  {
    throw std::invalid_argument(
      "ReferenceFrame: rotation quaternion has zero norm");
  }
  rotation_ = rotation.normalized().toRotationMatrix();
}

Coordinate ReferenceFrame::localToGlobal(const Coordinate& localPoint) const
{
  // Rotate to global orientation, then translate to global position
  return Coordinate{rotation_ * localPoint + origin_};
}

Coordinate ReferenceFrame::globalToLocal(const Coordinate& globalPoint) const
{
  // Translate to frame origin, then rotate to local orientation
  return Coordinate{rotation_.transpose() * (globalPoint - origin_)};
}

Vector3D ReferenceFrame::localToGlobalRelative(const Vector3D& localVector) const
{
  return Vector3D{rotation_ * localVector};
}

Vector3D ReferenceFrame::globalToLocalRelative(
  const Vector3D& globalVector) const
{
  return Vector3D{rotation_.transpose() * globalVector};
}

void ReferenceFrame::localToGlobalBatch(Eigen::Matrix3Xd& localPoints) const
{
  localPoints.applyOnTheLeft(rotation_);
  localPoints.colwise() += static_cast<const Eigen::Vector3d&>(origin_);
}

void ReferenceFrame::globalToLocalBatch(Eigen::Matrix3Xd& globalPoints) const
{
  globalPoints.colwise() -= static_cast<const Eigen::Vector3d&>(origin_);
  globalPoints.applyOnTheLeft(rotation_.transpose());
}

ReferenceFrame ReferenceFrame::relativeTo(const ReferenceFrame& other) const
{
  // p_other = R_o^T (R_t p + o_t - o_o)
  Eigen::Matrix3d const rotation = other.rotation_.transpose() * rotation_;
  Coordinate const origin = other.globalToLocal(origin_);

  ReferenceFrame relative{origin};
  relative.rotation_ = rotation;
  return relative;
}

void ReferenceFrame::setOrigin(const Coordinate& origin)
{
  origin_ = origin;
}

void ReferenceFrame::setRotation(const Eigen::Matrix3d& rotation)
{
  validateRotation(rotation);
  rotation_ = rotation;
}

void ReferenceFrame::validateRotation(const Eigen::Matrix3d& rotation)
{
  Eigen::Matrix3d const shouldBeIdentity = rotation.transpose() * rotation;
  if (!shouldBeIdentity.isIdentity(kOrthonormalTolerance))
  {
    throw std::invalid_argument(
      "ReferenceFrame: rotation matrix is not orthonormal");
  }
  if (std::abs(rotation.determinant() - 1.0) > kOrthonormalTolerance)
  {
    throw std::invalid_argument(
      "ReferenceFrame: rotation matrix is a reflection (determinant != +1)");
  }
}

}  // namespace hydro_sim
