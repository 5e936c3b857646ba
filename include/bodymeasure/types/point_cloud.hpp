#pragma once

#include <eigen3/Eigen/Core>

#include <vector>

namespace bodymeasure
{
using point_cloud = std::vector<Eigen::Vector3d, Eigen::aligned_allocator<Eigen::Vector3d>>;
using points_2d = std::vector<Eigen::Vector2d, Eigen::aligned_allocator<Eigen::Vector2d>>;

/**
 * Build a point cloud from a row-major buffer of `columns` values per vertex.
 * Throws std::invalid_argument unless columns == 3, the size is a multiple of 3 and every value is finite.
 */
point_cloud fromFlatBuffer(const std::vector<double> &values, size_t columns);

// Throws std::invalid_argument if any coordinate is NaN or infinite.
void validateFinite(const point_cloud &cloud);
} // namespace bodymeasure
