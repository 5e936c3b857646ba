#include <bodymeasure/types/closed_loop.hpp>
#include <bodymeasure/types/measurement_result.hpp>
#include <bodymeasure/types/warning_codes.hpp>

#include <algorithm>

namespace bodymeasure
{

bool MeasurementResult::hasWarning(const std::string &code) const
{
    return std::find(warnings.begin(), warnings.end(), code) != warnings.end();
}

bool MeasurementResult::hasWarningFamily(const std::string &family) const
{
    return std::any_of(warnings.begin(), warnings.end(),
                       [&family](const std::string &w) { return codes::family(w) == family; });
}

std::string toString(LoopMethod method)
{
    switch (method)
    {
    case LoopMethod::NONE:
        return "none";
    case LoopMethod::POLAR_ANGLE:
        return "polar_angle";
    case LoopMethod::ALPHA_SHAPE:
        return "alpha_shape";
    case LoopMethod::SECONDARY_BOUNDARY:
        return "secondary_boundary";
    case LoopMethod::CLUSTER_TRIM:
        return "cluster_trim";
    case LoopMethod::CONVEX_HULL:
        return "convex_hull";
    case LoopMethod::SINGLE_COMPONENT_FALLBACK:
        return "single_component_fallback";
    }
    return "none";
}

} // namespace bodymeasure
