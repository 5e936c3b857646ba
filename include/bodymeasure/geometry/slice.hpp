#pragma once

#include <bodymeasure/types/point_cloud.hpp>

#include <string>
#include <utility>
#include <vector>

namespace bodymeasure
{

struct slice_band
{
    double height = 0;
    double tolerance = 0;

    // points inside the band projected onto the two remaining axes (in increasing axis order),
    // sorted lexicographically with exact duplicates removed
    points_2d points;

    size_t points_in_band = 0; // before duplicate removal and downsampling
    bool downsampled = false;
};

/**
 * Cloud sorted once along the long axis, so that each band only visits the points inside it.
 * Holds a reference to the cloud, which must outlive it.
 */
class SliceIndex
{
  public:
    SliceIndex(const point_cloud &cloud, int axis);

    /**
     * Select the points with |p[axis] - height| <= tolerance and project them to 2D. The output order is canonical:
     * it depends only on the point positions, never on their order in the cloud. When more than `max_points` remain
     * (0 = unlimited) an evenly strided subset of the canonical order is kept.
     */
    slice_band slice(double height, double tolerance, size_t max_points) const;

    int axis() const
    {
        return _axis;
    }

  private:
    const point_cloud &_cloud;
    int _axis;
    std::vector<std::pair<double, size_t>> _sorted; // axis value, cloud index
};

slice_band slicePoints(const point_cloud &cloud, int axis, double height, double tolerance, size_t max_points);

// Lexicographic (x, then y) ordering used for canonical point order.
bool lexicographicLess(const Eigen::Vector2d &a, const Eigen::Vector2d &b);

Eigen::Vector2d centroidOf(const points_2d &points);

} // namespace bodymeasure
