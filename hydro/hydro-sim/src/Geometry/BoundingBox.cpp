#include "hydro-sim/src/Geometry/BoundingBox.hpp"

#include <format>
#include <stdexcept>

namespace hydro_sim
{

BoundingBox::BoundingBox(const Coordinate& min, const Coordinate& max)
  : min_{min}, max_{max}
{
  if (min_.x() > max_.x() || min_.y() > max_.y() || min_.z() > max_.z())
  {
    throw std::invalid_argument(
      std::format("BoundingBox: min {} exceeds max {}", min_, max_));
  }
}

BoundingBox BoundingBox::fromPoints(std::span<const Coordinate> points)
{
  if (points.empty())
  {
    throw std::invalid_argument(
      "BoundingBox: cannot bound an empty point set");
  }

  Eigen::Vector3d lower = points.front();
  Eigen::Vector3d upper = points.front();
  for (const auto& point : points.subspan(1))
  {
    lower = lower.cwiseMin(point);
    upper = upper.cwiseMax(point);
  }
  return BoundingBox{Coordinate{lower}, Coordinate{upper}};
}

bool BoundingBox::overlaps(const BoundingBox& other) const
{
  return min_.x() <= other.max_.x() && max_.x() >= other.min_.x() &&
         min_.y() <= other.max_.y() && max_.y() >= other.min_.y() &&
         min_.z() <= other.max_.z() && max_.z() >= other.min_.z();
}

bool BoundingBox::contains(const Coordinate& point) const
{
  return (point.array() >= min_.array()).all() &&
         (point.array() <= max_.array()).all();
}

BoundingBox BoundingBox::merged(const BoundingBox& other) const
{
  BoundingBox result;
  result.min_ = min_.cwiseMin(other.min_);
  result.max_ = max_.cwiseMax(other.max_);
  return result;
}

Coordinate BoundingBox::center() const
{
  return Coordinate{0.5 * (min_ + max_)};
}

Vector3D BoundingBox::extent() const
{
  return Vector3D{max_ - min_};
}

}  // namespace hydro_sim
