#pragma once

#include <algorithm>
#include <cmath>
#include <vector>

namespace bodymeasure
{

// Lower median, NaN when empty.
inline double lowerMedian(std::vector<double> values)
{
    if (values.empty())
        return NAN;
    auto mid = values.begin() + (values.size() - 1) / 2;
    std::nth_element(values.begin(), mid, values.end());
    return *mid;
}

// Linearly interpolated percentile in [0, 100], NaN when empty.
inline double percentile(std::vector<double> values, double pct)
{
    if (values.empty())
        return NAN;
    std::sort(values.begin(), values.end());
    const double rank = pct / 100.0 * (values.size() - 1);
    const size_t lower = static_cast<size_t>(std::floor(rank));
    const size_t upper = std::min(lower + 1, values.size() - 1);
    return values[lower] + (rank - lower) * (values[upper] - values[lower]);
}

} // namespace bodymeasure
