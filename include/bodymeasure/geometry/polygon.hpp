#pragma once

#include <bodymeasure/types/point_cloud.hpp>

namespace bodymeasure
{

// Sum of edge lengths of the implicitly closed polygon, including the edge from the last point back to the first.
double polygonPerimeter(const points_2d &loop);

// Absolute shoelace area of the implicitly closed polygon.
double polygonArea(const points_2d &loop);

/**
 * Drop points closer than `epsilon` to the previously kept point, then drop the last point if it coincides with
 * the first. The geometric result is unchanged, only zero length edges disappear.
 */
points_2d mergeNearDuplicates(const points_2d &loop, double epsilon);

/**
 * Andrew's monotone chain, counter-clockwise starting from the lexicographically smallest point, without
 * collinear points. Empty when fewer than 3 distinct or only collinear points are given.
 */
points_2d convexHull(points_2d points);

/**
 * Points ordered by polar angle around `center`, ties by radius, with near duplicates merged. Only positions
 * decide the order, so any permutation of the input gives the same loop.
 */
points_2d polarOrder(const points_2d &points, const Eigen::Vector2d &center, double epsilon);

// Largest angular gap in radians between consecutive points of `loop` as seen from `center`.
double maxAngularGap(const points_2d &loop, const Eigen::Vector2d &center);

} // namespace bodymeasure
