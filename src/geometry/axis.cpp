#include <bodymeasure/geometry/axis.hpp>

#include <bodymeasure/types/warning_codes.hpp>

#include <spdlog/spdlog.h>

namespace bodymeasure
{

std::string axisName(int axis)
{
    switch (axis)
    {
    case 0:
        return "x";
    case 1:
        return "y";
    case 2:
        return "z";
    }
    return "none";
}

axis_estimate estimateAxis(const point_cloud &cloud, const measure_options &options)
{
    axis_estimate estimate;
    if (cloud.empty())
    {
        estimate.degenerate = true;
        estimate.warnings.emplace_back(codes::BODY_AXIS_TOO_SHORT);
        return estimate;
    }

    Eigen::Vector3d lower = cloud.front(), upper = cloud.front();
    for (const Eigen::Vector3d &p : cloud)
    {
        lower = lower.cwiseMin(p);
        upper = upper.cwiseMax(p);
    }
    const Eigen::Vector3d extents = upper - lower;

    switch (options.axis)
    {
    case AxisChoice::X:
        estimate.axis = 0;
        break;
    case AxisChoice::Y:
        estimate.axis = 1;
        break;
    case AxisChoice::Z:
        estimate.axis = 2;
        break;
    case AxisChoice::AUTO:
        break;
    }

    if (estimate.axis >= 0)
    {
        estimate.reason = "configured";
    }
    else
    {
        estimate.axis = 0;
        for (int i = 1; i < 3; i++)
        {
            if (extents[i] > extents[estimate.axis])
            {
                estimate.axis = i;
            }
        }

        int tied = 0;
        for (int i = 0; i < 3; i++)
        {
            if (extents[i] == extents[estimate.axis])
            {
                tied++;
            }
        }
        if (tied > 1)
        {
            estimate.reason = "largest_extent_tie";
            estimate.warnings.emplace_back(codes::AXIS_TIE);
        }
        else
        {
            estimate.reason = "largest_extent";
        }
    }

    estimate.min = lower[estimate.axis];
    estimate.max = upper[estimate.axis];
    estimate.extent = extents[estimate.axis];

    if (estimate.extent < options.min_axis_extent)
    {
        estimate.degenerate = true;
        estimate.warnings.emplace_back(codes::BODY_AXIS_TOO_SHORT);
    }
    else if (estimate.extent > options.plausible_extent_max)
    {
        estimate.warnings.emplace_back(codes::UNIT_FAIL_SCALE_LARGE);
    }
    else if (estimate.extent < options.plausible_extent_min)
    {
        estimate.warnings.emplace_back(codes::UNIT_FAIL_SCALE_SMALL);
    }

    spdlog::trace("axis {} ({}) extent {} [{}, {}]", axisName(estimate.axis), estimate.reason, estimate.extent,
                  estimate.min, estimate.max);
    return estimate;
}

} // namespace bodymeasure
