#include <bodymeasure/select/region_selector.hpp>

#include <spdlog/spdlog.h>

#include <cmath>

namespace
{
using bodymeasure::slice_component;

// NaN compares as the worst value in every criterion
int compareAscending(double a, double b, double epsilon)
{
    const bool a_nan = std::isnan(a), b_nan = std::isnan(b);
    if (a_nan || b_nan)
        return a_nan == b_nan ? 0 : (a_nan ? 1 : -1);
    if (std::abs(a - b) <= epsilon)
        return 0;
    return a < b ? -1 : 1;
}

int compareDescending(double a, double b, double epsilon)
{
    const bool a_nan = std::isnan(a), b_nan = std::isnan(b);
    if (a_nan || b_nan)
        return a_nan == b_nan ? 0 : (a_nan ? 1 : -1);
    return compareAscending(b, a, epsilon);
}

/**
 * <0 when a is preferred over b. `criterion` receives the first criterion that decided.
 */
int compareComponents(const slice_component &a, const slice_component &b, double epsilon, std::string &criterion)
{
    int c = compareAscending(a.centerline_distance, b.centerline_distance, epsilon);
    criterion = "distance";
    if (c != 0)
        return c;

    c = compareDescending(a.area, b.area, epsilon);
    criterion = "area";
    if (c != 0)
        return c;

    c = compareDescending(a.perimeter, b.perimeter, epsilon);
    criterion = "perimeter";
    if (c != 0)
        return c;

    criterion = "centroid";
    c = compareAscending(a.centroid.x(), b.centroid.x(), 0);
    if (c != 0)
        return c;
    return compareAscending(a.centroid.y(), b.centroid.y(), 0);
}
} // namespace

namespace bodymeasure
{

region_selection selectRegion(const std::vector<slice_component> &components, double tie_epsilon)
{
    region_selection selection;
    if (components.empty())
    {
        return selection;
    }
    selection.index = 0;
    if (components.size() == 1)
    {
        selection.single_component = true;
        return selection;
    }

    for (size_t i = 1; i < components.size(); i++)
    {
        std::string criterion;
        if (compareComponents(components[i], components[selection.index], tie_epsilon, criterion) < 0)
        {
            selection.index = static_cast<int64_t>(i);
        }
    }

    // the deciding criterion is the one separating the winner from its closest competitor
    selection.criterion = "distance";
    int deciding_rank = 0;
    static const char *ranks[] = {"distance", "area", "perimeter", "centroid"};
    for (size_t i = 0; i < components.size(); i++)
    {
        if (static_cast<int64_t>(i) == selection.index)
            continue;
        std::string criterion;
        compareComponents(components[selection.index], components[i], tie_epsilon, criterion);
        for (int r = 0; r < 4; r++)
        {
            if (criterion == ranks[r] && r > deciding_rank)
            {
                deciding_rank = r;
            }
        }
    }
    selection.criterion = ranks[deciding_rank];

    spdlog::trace("selected component {} of {} by {}", selection.index, components.size(), selection.criterion);
    return selection;
}

} // namespace bodymeasure
