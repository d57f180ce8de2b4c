#ifndef HYDRO_SIM_PHYSICS_BOUNDING_BOX_TREE_HPP
#define HYDRO_SIM_PHYSICS_BOUNDING_BOX_TREE_HPP

#include <cstddef>
#include <limits>
#include <utility>
#include <vector>

#include "hydro-sim/src/DataTypes/Coordinate.hpp"
#include "hydro-sim/src/Geometry/BoundingBox.hpp"

namespace hydro_sim
{

/// (index in the first tree, index in the second tree)
using IndexPair = std::pair<size_t, size_t>;

/**
 * @brief Static binary bounding volume hierarchy over a set of boxes.
 *
 * One leaf per input box; leaf indices are positions in the input vector.
 * Built top-down: each node splits its boxes at the median box center along
 * the longest axis of the center bounds. Internal node bounds are the union
 * of their children's bounds. Overlap tests use closed intervals.
 */
class BoundingBoxTree
{
public:
  /**
   * @brief Empty tree, every query returns nothing.
   */
  BoundingBoxTree() = default;

  explicit BoundingBoxTree(std::vector<BoundingBox> boxes);

  /**
   * @brief Leaves whose box overlaps @p box.
   * @return Leaf indices in ascending order
   */
  [[nodiscard]] std::vector<size_t> query(const BoundingBox& box) const;

  /**
   * @brief All (i, j) with leaf i of this tree overlapping leaf j of @p other.
   *
   * Descends both trees simultaneously.
   *
   * @param maxPairs Stop once this many pairs are found, 0 = unlimited
   * @return Pairs ordered by i, then j
   */
  [[nodiscard]] std::vector<IndexPair> overlappingPairs(
    const BoundingBoxTree& other,
    size_t maxPairs = 0) const;

  /// Number of leaves
  [[nodiscard]] size_t size() const
  {
    return boxes_.size();
  }

  [[nodiscard]] bool empty() const
  {
    return boxes_.empty();
  }

  /**
   * @brief Union of all leaf boxes.
   * @throws std::out_of_range if the tree is empty
   */
  [[nodiscard]] const BoundingBox& getBounds() const;

  [[nodiscard]] const BoundingBox& getLeafBox(size_t index) const
  {
    return boxes_.at(index);
  }

  /// Longest root-to-leaf path, 1 for a single leaf
  [[nodiscard]] size_t getDepth() const;

private:
  static constexpr size_t kNoChild = std::numeric_limits<size_t>::max();

  struct Node
  {
    BoundingBox bounds;
    size_t left{kNoChild};
    size_t right{kNoChild};
    size_t leaf{kNoChild};  // Input box index, leaves only

    [[nodiscard]] bool isLeaf() const
    {
      return left == kNoChild && right == kNoChild;
    }
  };

  size_t buildNode(std::vector<size_t>& ids,
                   size_t begin,
                   size_t end,
                   const std::vector<Coordinate>& centers);

  [[nodiscard]] size_t depthOf(size_t node) const;

  std::vector<BoundingBox> boxes_;  // Leaf boxes in input order
  std::vector<Node> nodes_;         // Root at index 0
};

}  // namespace hydro_sim

#endif  // HYDRO_SIM_PHYSICS_BOUNDING_BOX_TREE_HPP
