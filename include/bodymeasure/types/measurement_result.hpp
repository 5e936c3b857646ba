#pragma once

#include <bodymeasure/types/measurement_key.hpp>

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bodymeasure
{

struct loop_attempt_record
{
    std::string strategy;
    std::string code; // empty when the attempt produced the loop

    bool operator==(const loop_attempt_record &other) const
    {
        return strategy == other.strategy && code == other.code;
    }
};

/**
 * Observed facts about the chosen cross-section, enough to audit a result without re-running it.
 */
struct section_facts
{
    std::string axis;
    double axis_extent = NAN;
    double plane_value = NAN;
    double height_fraction = NAN;
    double slice_tolerance = NAN;
    double connectivity_distance = NAN;

    size_t candidate_count = 0;
    size_t valid_candidate_count = 0;
    int64_t candidate_index = -1;

    size_t slice_point_count = 0;
    size_t component_count = 0;
    std::string tiebreak = "none";

    size_t loop_point_count = 0;
    double loop_area = NAN;

    // the strategy guarantees a non-self-intersecting loop
    bool loop_simple = false;
    // the loop is known to differ from the silhouette (convex hull)
    bool loop_approximation = false;

    double shape_ratio = NAN;
    std::optional<size_t> alpha_k;
    std::vector<loop_attempt_record> loop_attempts;
};

struct MeasurementResult
{
    MeasurementKey key = MeasurementKey::NECK;
    double value = NAN; // circumference in meters, NaN when undefined for this geometry
    std::string section_id;
    std::string method_tag = "none";
    std::vector<std::string> warnings;
    std::optional<std::string> failure_reason;
    section_facts facts;

    bool defined() const
    {
        return !std::isnan(value);
    }

    bool hasWarning(const std::string &code) const;
    bool hasWarningFamily(const std::string &family) const;
};

} // namespace bodymeasure
