#pragma once

#include <bodymeasure/types/measure_options.hpp>
#include <bodymeasure/types/point_cloud.hpp>

#include <cmath>
#include <string>
#include <vector>

namespace bodymeasure
{

struct axis_estimate
{
    int axis = -1; // 0 = x, 1 = y, 2 = z
    double min = NAN;
    double max = NAN;
    double extent = NAN;
    std::string reason; // largest_extent, largest_extent_tie or configured

    std::vector<std::string> warnings;

    // extent is too short to slice along
    bool degenerate = false;

    double heightAt(double fraction) const
    {
        return min + fraction * extent;
    }
};

std::string axisName(int axis);

/**
 * Long axis of the cloud: the coordinate with the largest extent unless the options force one.
 * Ties go to the lowest coordinate index and add AXIS_TIE. Unit plausibility of the extent is reported as a
 * UNIT_FAIL warning but never corrected.
 */
axis_estimate estimateAxis(const point_cloud &cloud, const measure_options &options);

} // namespace bodymeasure
