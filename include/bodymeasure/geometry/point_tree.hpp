#pragma once

#include <bodymeasure/types/point_cloud.hpp>

#include <jk/KDTree.h>

#include <array>
#include <vector>

namespace bodymeasure
{

// payload is the index into the points the tree was built from
using point_tree_2d = jk::tree::KDTree<size_t, 2>;

inline std::array<double, 2> toArray(const Eigen::Vector2d &v)
{
    return {v.x(), v.y()};
}

point_tree_2d buildPointTree(const points_2d &points);

/**
 * Distance from each point to its k-th nearest other point (k >= 1). Points with fewer than k others get the
 * distance to the farthest available one.
 */
std::vector<double> kthNeighbourDistances(const points_2d &points, const point_tree_2d &tree, size_t k);

// Indices within `radius` of `center`, ascending.
std::vector<size_t> neighboursWithin(const point_tree_2d &tree, const Eigen::Vector2d &center, double radius);

/**
 * Median distance to the nearest point that is farther than `epsilon`, NaN when no point has such a neighbour.
 */
double medianNeighbourSpacing(const points_2d &points, const point_tree_2d &tree, double epsilon);

} // namespace bodymeasure
