#pragma once

#include <bodymeasure/types/point_cloud.hpp>

#include <cmath>
#include <functional>

namespace bodymeasure
{
namespace testing_shapes
{

// ring in the x-z plane at height y
inline void addRing(point_cloud &cloud, double cx, double cz, double y, double radius, size_t count)
{
    for (size_t j = 0; j < count; j++)
    {
        const double theta = 2 * M_PI * j / count;
        cloud.emplace_back(cx + radius * std::cos(theta), y, cz + radius * std::sin(theta));
    }
}

// vertical cylinder along y from 0 to height, rings at height * i / (rings - 1)
inline point_cloud cylinder(double radius, double height = 1.0, size_t rings = 101, size_t per_ring = 200,
                            double scale = 1.0)
{
    point_cloud cloud;
    for (size_t i = 0; i < rings; i++)
    {
        addRing(cloud, 0, 0, height * i / (rings - 1), radius, per_ring);
    }
    for (Eigen::Vector3d &p : cloud)
    {
        p *= scale;
    }
    return cloud;
}

// torso of radius 0.15 from y = 0 to 1, with two arms of radius 0.04 at x = +-0.25 from y = 0.3 to 0.8
inline point_cloud torsoWithArms()
{
    point_cloud cloud;
    for (size_t i = 0; i <= 100; i++)
    {
        addRing(cloud, 0, 0, i / 100.0, 0.15, 200);
    }
    for (size_t i = 30; i <= 80; i++)
    {
        addRing(cloud, -0.25, 0, i / 100.0, 0.04, 80);
        addRing(cloud, 0.25, 0, i / 100.0, 0.04, 80);
    }
    return cloud;
}

// perimeter of the regular polygon the rings above are sampled as
inline double ringPerimeter(double radius, size_t count)
{
    return 2 * count * radius * std::sin(M_PI / count);
}

} // namespace testing_shapes
} // namespace bodymeasure
