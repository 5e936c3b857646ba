#include <bodymeasure/geometry/polygon.hpp>

#include <bodymeasure/geometry/slice.hpp>

#include <algorithm>
#include <cmath>
#include <vector>

namespace
{
double cross(const Eigen::Vector2d &o, const Eigen::Vector2d &a, const Eigen::Vector2d &b)
{
    return (a.x() - o.x()) * (b.y() - o.y()) - (a.y() - o.y()) * (b.x() - o.x());
}
} // namespace

namespace bodymeasure
{

double polygonPerimeter(const points_2d &loop)
{
    if (loop.size() < 2)
    {
        return 0;
    }
    double perimeter = 0;
    for (size_t i = 0; i < loop.size(); i++)
    {
        perimeter += (loop[(i + 1) % loop.size()] - loop[i]).norm();
    }
    return perimeter;
}

double polygonArea(const points_2d &loop)
{
    if (loop.size() < 3)
    {
        return 0;
    }
    double twice_area = 0;
    for (size_t i = 0; i < loop.size(); i++)
    {
        const Eigen::Vector2d &a = loop[i];
        const Eigen::Vector2d &b = loop[(i + 1) % loop.size()];
        twice_area += a.x() * b.y() - b.x() * a.y();
    }
    return 0.5 * std::abs(twice_area);
}

points_2d mergeNearDuplicates(const points_2d &loop, double epsilon)
{
    points_2d merged;
    merged.reserve(loop.size());
    for (const Eigen::Vector2d &p : loop)
    {
        if (merged.empty() || (p - merged.back()).norm() > epsilon)
        {
            merged.push_back(p);
        }
    }
    if (merged.size() > 1 && (merged.back() - merged.front()).norm() <= epsilon)
    {
        merged.pop_back();
    }
    return merged;
}

points_2d convexHull(points_2d points)
{
    std::sort(points.begin(), points.end(), lexicographicLess);
    points.erase(std::unique(points.begin(), points.end()), points.end());
    if (points.size() < 3)
    {
        return {};
    }

    points_2d hull(2 * points.size());
    size_t k = 0;
    for (size_t i = 0; i < points.size(); i++)
    {
        while (k >= 2 && cross(hull[k - 2], hull[k - 1], points[i]) <= 0)
            k--;
        hull[k++] = points[i];
    }
    for (size_t i = points.size() - 1, t = k + 1; i > 0; i--)
    {
        while (k >= t && cross(hull[k - 2], hull[k - 1], points[i - 1]) <= 0)
            k--;
        hull[k++] = points[i - 1];
    }
    hull.resize(k - 1);

    if (hull.size() < 3)
    {
        return {};
    }
    return hull;
}

points_2d polarOrder(const points_2d &points, const Eigen::Vector2d &center, double epsilon)
{
    struct polar_point
    {
        double angle, radius;
        size_t index;
    };
    std::vector<polar_point> polar;
    polar.reserve(points.size());
    for (size_t i = 0; i < points.size(); i++)
    {
        const Eigen::Vector2d d = points[i] - center;
        polar.push_back(polar_point{std::atan2(d.y(), d.x()), d.norm(), i});
    }
    std::sort(polar.begin(), polar.end(), [&points](const polar_point &a, const polar_point &b) {
        if (a.angle != b.angle)
            return a.angle < b.angle;
        if (a.radius != b.radius)
            return a.radius < b.radius;
        return lexicographicLess(points[a.index], points[b.index]);
    });

    points_2d ordered;
    ordered.reserve(points.size());
    for (const polar_point &p : polar)
    {
        ordered.push_back(points[p.index]);
    }
    return mergeNearDuplicates(ordered, epsilon);
}

double maxAngularGap(const points_2d &loop, const Eigen::Vector2d &center)
{
    if (loop.empty())
    {
        return 2 * M_PI;
    }
    std::vector<double> angles;
    angles.reserve(loop.size());
    for (const Eigen::Vector2d &p : loop)
    {
        angles.push_back(std::atan2(p.y() - center.y(), p.x() - center.x()));
    }
    std::sort(angles.begin(), angles.end());

    double gap = angles.front() + 2 * M_PI - angles.back();
    for (size_t i = 1; i < angles.size(); i++)
    {
        gap = std::max(gap, angles[i] - angles[i - 1]);
    }
    return gap;
}

} // namespace bodymeasure
