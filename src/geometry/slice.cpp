#include <bodymeasure/geometry/slice.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace bodymeasure
{

bool lexicographicLess(const Eigen::Vector2d &a, const Eigen::Vector2d &b)
{
    return a.x() < b.x() || (a.x() == b.x() && a.y() < b.y());
}

Eigen::Vector2d centroidOf(const points_2d &points)
{
    Eigen::Vector2d sum = Eigen::Vector2d::Zero();
    for (const Eigen::Vector2d &p : points)
    {
        sum += p;
    }
    return points.empty() ? Eigen::Vector2d(NAN, NAN) : Eigen::Vector2d(sum / points.size());
}

SliceIndex::SliceIndex(const point_cloud &cloud, int axis) : _cloud(cloud), _axis(axis)
{
    _sorted.reserve(cloud.size());
    for (size_t i = 0; i < cloud.size(); i++)
    {
        _sorted.emplace_back(cloud[i][axis], i);
    }
    std::sort(_sorted.begin(), _sorted.end());
}

slice_band SliceIndex::slice(double height, double tolerance, size_t max_points) const
{
    slice_band band;
    band.height = height;
    band.tolerance = tolerance;

    const int u = _axis == 0 ? 1 : 0;
    const int v = _axis == 2 ? 1 : 2;

    // widened range for the search only, the exact band test is below
    const double margin = 1e-9 * (std::abs(height) + tolerance);
    auto first = std::lower_bound(_sorted.begin(), _sorted.end(), height - tolerance - margin,
                                  [](const std::pair<double, size_t> &e, double value) { return e.first < value; });
    for (auto it = first; it != _sorted.end() && it->first <= height + tolerance + margin; ++it)
    {
        const Eigen::Vector3d &p = _cloud[it->second];
        if (std::abs(p[_axis] - height) <= tolerance)
        {
            band.points.emplace_back(p[u], p[v]);
        }
    }
    band.points_in_band = band.points.size();

    std::sort(band.points.begin(), band.points.end(), lexicographicLess);
    band.points.erase(std::unique(band.points.begin(), band.points.end()), band.points.end());

    if (max_points > 0 && band.points.size() > max_points)
    {
        points_2d kept;
        kept.reserve(max_points);
        const double stride = static_cast<double>(band.points.size()) / max_points;
        for (size_t i = 0; i < max_points; i++)
        {
            kept.push_back(band.points[static_cast<size_t>(std::floor(i * stride))]);
        }
        band.points = std::move(kept);
        band.downsampled = true;
    }

    spdlog::trace("slice at {} +- {}: {} in band, {} kept", height, tolerance, band.points_in_band,
                  band.points.size());
    return band;
}

slice_band slicePoints(const point_cloud &cloud, int axis, double height, double tolerance, size_t max_points)
{
    return SliceIndex(cloud, axis).slice(height, tolerance, max_points);
}

} // namespace bodymeasure
