#pragma once

#include <bodymeasure/types/measurement_key.hpp>

#include <array>
#include <string>

namespace bodymeasure
{

enum class AxisChoice
{
    AUTO,
    X,
    Y,
    Z
};

/**
 * Every threshold of a measurement call. Passed by const reference, never stored globally, so that two calls with
 * equal options are reproducible across threads and processes.
 */
struct measure_options
{
    AxisChoice axis = AxisChoice::AUTO;
    double min_axis_extent = 1e-6;

    size_t num_candidates = 20;
    double slice_tolerance = 0; // 0 = derive from the candidate spacing
    double min_tolerance_fraction = 0.002;
    size_t min_slice_points = 3;
    size_t max_slice_points = 20000; // 0 = unlimited

    double connectivity_distance = 0; // 0 = derive from the slice point spacing
    double connectivity_spacing_factor = 4.0;
    size_t min_component_points = 3;
    double tie_epsilon = 1e-6;

    double dedupe_epsilon = 1e-6;
    size_t min_loop_points = 3;
    double jump_factor = 10.0;

    // a fallback boundary shorter than this fraction of the component's convex hull perimeter is a fragment
    double min_hull_perimeter_fraction = 0.2;

    std::array<size_t, 3> alpha_k_choices{3, 5, 7};
    size_t alpha_default_k = 5;
    double alpha_boundary_ratio = 1.5;
    double secondary_percentile = 75.0;
    size_t cluster_min_samples = 3;
    double cluster_eps_factor = 2.0;

    double plausible_extent_min = 0.1;
    double plausible_extent_max = 3.0;
    double perimeter_small = 0.1;
    double perimeter_large = 3.0;

    std::string case_id;

    policy_table policies = defaultPolicyTable();
};

// Throws std::invalid_argument for option combinations that cannot produce a measurement.
void validateOptions(const measure_options &options);

} // namespace bodymeasure
