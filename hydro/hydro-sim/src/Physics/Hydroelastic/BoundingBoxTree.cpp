#include "hydro-sim/src/Physics/Hydroelastic/BoundingBoxTree.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace hydro_sim
{

BoundingBoxTree::BoundingBoxTree(std::vector<BoundingBox> boxes)
  : boxes_{std::move(boxes)}
{
  if (boxes_.empty())
  {
    return;
  }

  std::vector<Coordinate> centers;
  centers.reserve(boxes_.size());
  for (const auto& box : boxes_)
  {
    centers.push_back(box.center());
  }

  std::vector<size_t> ids(boxes_.size());
  std::iota(ids.begin(), ids.end(), size_t{0});

  nodes_.reserve(2 * boxes_.size() - 1);
  buildNode(ids, 0, ids.size(), centers);
}

size_t BoundingBoxTree::buildNode(std::vector<size_t>& ids,
                                  size_t begin,
                                  size_t end,
                                  const std::vector<Coordinate>& centers)
{
  size_t const index = nodes_.size();
  nodes_.emplace_back();

  if (end - begin == 1)
  {
    nodes_[index].bounds = boxes_[ids[begin]];
    nodes_[index].leaf = ids[begin];
    return index;
  }

  // Split along the longest axis of the box centers
  Eigen::Vector3d lower = centers[ids[begin]];
  Eigen::Vector3d upper = centers[ids[begin]];
  for (size_t i = begin + 1; i < end; ++i)
  {
    lower = lower.cwiseMin(centers[ids[i]]);
    upper = upper.cwiseMax(centers[ids[i]]);
  }
  Eigen::Index axis{0};
  (upper - lower).maxCoeff(&axis);

  auto const first = ids.begin() + static_cast<std::ptrdiff_t>(begin);
  auto const last = ids.begin() + static_cast<std::ptrdiff_t>(end);
  size_t const mid = begin + (end - begin) / 2;
  std::nth_element(first,
                   ids.begin() + static_cast<std::ptrdiff_t>(mid),
                   last,
                   [&](size_t a, size_t b)
                   { return centers[a](axis) < centers[b](axis); });

  size_t const left = buildNode(ids, begin, mid, centers);
  size_t const right = buildNode(ids, mid, end, centers);

  // nodes_ may have reallocated during recursion
  nodes_[index].left = left;
  nodes_[index].right = right;
  nodes_[index].bounds = nodes_[left].bounds.merged(nodes_[right].bounds);
  return index;
}

std::vector<size_t> BoundingBoxTree::query(const BoundingBox& box) const
{
  std::vector<size_t> result;
  if (nodes_.empty())
  {
    return result;
  }

  std::vector<size_t> stack{0};
  while (!stack.empty())
  {
    const Node& node = nodes_[stack.back()];
    stack.pop_back();

    if (!node.bounds.overlaps(box))
    {
      continue;
    }

    if (node.isLeaf())
    {
      result.push_back(node.leaf);
    }
    else
    {
      stack.push_back(node.right);
      stack.push_back(node.left);
    }
  }

  std::ranges::sort(result);
  return result;
}

std::vector<IndexPair> BoundingBoxTree::overlappingPairs(
  const BoundingBoxTree& other,
  size_t maxPairs) const
{
  std::vector<IndexPair> pairs;
  if (nodes_.empty() || other.nodes_.empty())
  {
    return pairs;
  }

  std::vector<IndexPair> stack{{0, 0}};
  while (!stack.empty())
  {
    if (maxPairs != 0 && pairs.size() >= maxPairs)
    {
      break;
    }

    auto const [thisIndex, otherIndex] = stack.back();
    stack.pop_back();

    const Node& a = nodes_[thisIndex];
    const Node& b = other.nodes_[otherIndex];
    if (!a.bounds.overlaps(b.bounds))
    {
      continue;
    }

    if (a.isLeaf() && b.isLeaf())
    {
      pairs.emplace_back(a.leaf, b.leaf);
      continue;
    }

    // Descend into the larger node, or the only internal one
    bool const descendThis =
      !a.isLeaf() &&
      (b.isLeaf() || a.bounds.extent().squaredNorm() >=
                       b.bounds.extent().squaredNorm());
    if (descendThis)
    {
      stack.emplace_back(a.right, otherIndex);
      stack.emplace_back(a.left, otherIndex);
    }
    else
    {
      stack.emplace_back(thisIndex, b.right);
      stack.emplace_back(thisIndex, b.left);
    }
  }

  std::ranges::sort(pairs);
  return pairs;
}

const BoundingBox& BoundingBoxTree::getBounds() const
{
  if (nodes_.empty())
  {
    throw std::out_of_range("BoundingBoxTree: empty tree has no bounds");
  }
  return nodes_.front().bounds;
}

size_t BoundingBoxTree::getDepth() const
{
  return nodes_.empty() ? 0 : depthOf(0);
}

size_t BoundingBoxTree::depthOf(size_t node) const
{
  if (nodes_[node].isLeaf())
  {
    return 1;
  }
  return 1 + std::max(depthOf(nodes_[node].left), depthOf(nodes_[node].right));
}

}  // namespace hydro_sim
