#include <bodymeasure/types/measure_options.hpp>

#include <cmath>
#include <stdexcept>

namespace bodymeasure
{

void validateOptions(const measure_options &options)
{
    auto require = [](bool condition, const char *message) {
        if (!condition)
        {
            throw std::invalid_argument(message);
        }
    };

    require(options.num_candidates > 0, "num_candidates must be at least 1");
    require(std::isfinite(options.slice_tolerance) && options.slice_tolerance >= 0,
            "slice_tolerance must be finite and non-negative");
    require(std::isfinite(options.connectivity_distance) && options.connectivity_distance >= 0,
            "connectivity_distance must be finite and non-negative");
    require(options.connectivity_spacing_factor > 0, "connectivity_spacing_factor must be positive");
    require(options.min_slice_points >= 3, "min_slice_points must be at least 3");
    require(options.min_loop_points >= 3, "min_loop_points must be at least 3");
    require(options.min_component_points >= 1, "min_component_points must be at least 1");
    require(options.tie_epsilon >= 0 && options.dedupe_epsilon >= 0, "epsilons must be non-negative");
    require(options.jump_factor > 1, "jump_factor must be greater than 1");
    require(options.min_hull_perimeter_fraction >= 0 && options.min_hull_perimeter_fraction <= 1,
            "min_hull_perimeter_fraction must be within [0, 1]");
    require(options.alpha_default_k >= 1, "alpha_default_k must be at least 1");
    for (size_t k : options.alpha_k_choices)
    {
        require(k >= 1, "alpha_k_choices must be at least 1");
    }
    require(options.alpha_boundary_ratio > 0, "alpha_boundary_ratio must be positive");
    require(options.secondary_percentile >= 0 && options.secondary_percentile <= 100,
            "secondary_percentile must be within [0, 100]");
    require(options.cluster_min_samples >= 1 && options.cluster_eps_factor > 0, "invalid cluster/trim parameters");

    for (const region_policy &policy : options.policies)
    {
        require(policy.start_fraction >= 0 && policy.end_fraction <= 1 &&
                    policy.start_fraction <= policy.end_fraction,
                "region fractions must satisfy 0 <= start <= end <= 1");
    }
}

} // namespace bodymeasure
