#pragma once

#include <bodymeasure/types/closed_loop.hpp>

#include <string>
#include <vector>

namespace bodymeasure
{

struct region_selection
{
    // index into the components, -1 when there are none
    int64_t index = -1;

    // criterion that separated the winner from the runner-up: none (single component), distance, area,
    // perimeter or centroid
    std::string criterion = "none";

    bool single_component = false;

    bool tiebreakUsed() const
    {
        return criterion == "area" || criterion == "perimeter" || criterion == "centroid";
    }
};

/**
 * Choose the component nearest the slice centroid. Distances equal within `tie_epsilon` fall through to larger
 * area, then larger perimeter, then the lexicographically smallest centroid. Uses positions only.
 */
region_selection selectRegion(const std::vector<slice_component> &components, double tie_epsilon);

} // namespace bodymeasure
