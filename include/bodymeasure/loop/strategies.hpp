#pragma once

#include <bodymeasure/types/closed_loop.hpp>
#include <bodymeasure/types/measure_options.hpp>
#include <bodymeasure/types/measurement_result.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace bodymeasure
{

struct loop_input
{
    const slice_component &component;
    Eigen::Vector2d slice_centroid;
    size_t slice_point_count;

    // a single component where the region should have separated from the limbs
    bool single_component_forced;

    size_t alpha_k;
    const measure_options &options;
};

/**
 * Outcome of one boundary construction strategy: a loop, or the reason it was rejected.
 */
struct strategy_result
{
    LoopMethod method = LoopMethod::NONE;
    closed_loop loop;
    std::string reason; // empty on success
    std::vector<std::string> warnings;
    std::optional<size_t> alpha_k;

    bool ok() const
    {
        return reason.empty();
    }

    static strategy_result failure(std::string reason)
    {
        strategy_result r;
        r.reason = std::move(reason);
        return r;
    }
};

struct named_strategy
{
    std::string name;  // recorded in the attempt trace
    std::string stage; // prefix of the failure code, e.g. ALPHA -> ALPHA_FAIL:<reason>
    std::function<strategy_result(const loop_input &)> run;

    // decides from the attempts so far whether this strategy is tried at all, always when empty
    std::function<bool(const loop_input &, const std::vector<loop_attempt_record> &)> applies;
};

// k for the alpha boundary: a stable FNV-1a hash of the case id picks one of the configured choices.
size_t alphaKForCase(const std::string &case_id, const measure_options &options);

strategy_result polarAngleLoop(const loop_input &input);
strategy_result alphaShapeLoop(const loop_input &input, size_t k);
strategy_result secondaryBoundaryLoop(const loop_input &input);
strategy_result clusterTrimLoop(const loop_input &input);
strategy_result convexHullLoop(const loop_input &input);

/**
 * polar_angle, alpha_shape, alpha_relax, secondary_boundary, cluster_trim, convex_hull
 */
std::vector<named_strategy> defaultStrategyChain();

} // namespace bodymeasure
