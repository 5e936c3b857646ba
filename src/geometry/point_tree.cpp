#include <bodymeasure/geometry/point_tree.hpp>

#include <bodymeasure/geometry/utils.hpp>

#include <algorithm>
#include <cmath>

namespace bodymeasure
{

point_tree_2d buildPointTree(const points_2d &points)
{
    point_tree_2d tree;
    for (size_t i = 0; i < points.size(); i++)
    {
        tree.addPoint(toArray(points[i]), i);
    }
    return tree;
}

std::vector<double> kthNeighbourDistances(const points_2d &points, const point_tree_2d &tree, size_t k)
{
    std::vector<double> distances;
    distances.reserve(points.size());
    for (const Eigen::Vector2d &p : points)
    {
        // the query point itself is the first result
        const auto nn = tree.searchKnn(toArray(p), k + 1);
        distances.push_back(nn.size() > 1 ? std::sqrt(nn.back().distance) : 0.);
    }
    return distances;
}

std::vector<size_t> neighboursWithin(const point_tree_2d &tree, const Eigen::Vector2d &center, double radius)
{
    // inflate slightly so that points exactly on the radius are kept, searchBall is exclusive
    const double r2 = radius * radius * (1 + 1e-12) + 1e-300;
    std::vector<size_t> indices;
    for (const auto &dp : tree.searchBall(toArray(center), r2))
    {
        indices.push_back(dp.payload);
    }
    std::sort(indices.begin(), indices.end());
    return indices;
}

double medianNeighbourSpacing(const points_2d &points, const point_tree_2d &tree, double epsilon)
{
    const double eps2 = epsilon * epsilon;
    std::vector<double> spacing;
    spacing.reserve(points.size());
    for (const Eigen::Vector2d &p : points)
    {
        // widen the search to step over near-coincident points
        for (size_t k = 2;; k *= 2)
        {
            const size_t count = std::min(k, points.size());
            const auto nn = tree.searchKnn(toArray(p), count);
            auto it = std::find_if(nn.begin(), nn.end(), [eps2](const point_tree_2d::DistancePayload &dp) {
                return dp.distance > eps2;
            });
            if (it != nn.end())
            {
                spacing.push_back(std::sqrt(it->distance));
                break;
            }
            if (count == points.size() || k >= 64)
                break;
        }
    }
    return lowerMedian(spacing);
}

} // namespace bodymeasure
