#pragma once

#include <bodymeasure/types/point_cloud.hpp>

#include <cmath>
#include <string>

namespace bodymeasure
{

enum class LoopMethod
{
    NONE,
    POLAR_ANGLE,
    ALPHA_SHAPE,
    SECONDARY_BOUNDARY,
    CLUSTER_TRIM,
    CONVEX_HULL,
    SINGLE_COMPONENT_FALLBACK
};

std::string toString(LoopMethod method);

/**
 * Ordered boundary, implicitly closed (the last point connects back to the first, which is not repeated).
 * `simple` is only set by strategies that guarantee a non-self-intersecting polygon.
 * `approximation` marks boundaries known to differ from the true silhouette (convex hull).
 */
struct closed_loop
{
    points_2d points;
    bool simple = false;
    bool approximation = false;
};

struct slice_component
{
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    points_2d points;
    Eigen::Vector2d centroid{NAN, NAN};
    double centerline_distance = NAN;

    // from the component's polar loop, NaN when no loop could be formed
    double area = NAN;
    double perimeter = NAN;

    size_t first_index = 0; // lowest slice index in the component
};

} // namespace bodymeasure
