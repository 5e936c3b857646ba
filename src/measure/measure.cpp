#include <bodymeasure/measure/measure.hpp>

#include <bodymeasure/geometry/axis.hpp>
#include <bodymeasure/geometry/slice.hpp>
#include <bodymeasure/geometry/utils.hpp>
#include <bodymeasure/loop/strategies.hpp>
#include <bodymeasure/measure/section_id.hpp>
#include <bodymeasure/measure/section_pipeline.hpp>
#include <bodymeasure/types/warning_codes.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>

namespace
{
using namespace bodymeasure;

void append(std::vector<std::string> &to, const std::vector<std::string> &from)
{
    to.insert(to.end(), from.begin(), from.end());
}

struct candidate_choice
{
    size_t index = 0; // into the valid candidates
    bool ambiguous = false;
};

// lowest index within tie_epsilon of the statistic's target wins
candidate_choice chooseCandidate(const std::vector<double> &perimeters, SelectionStatistic statistic,
                                 double tie_epsilon)
{
    double target = NAN;
    switch (statistic)
    {
    case SelectionStatistic::MAX:
        target = *std::max_element(perimeters.begin(), perimeters.end());
        break;
    case SelectionStatistic::MIN:
        target = *std::min_element(perimeters.begin(), perimeters.end());
        break;
    case SelectionStatistic::MEDIAN:
        target = lowerMedian(perimeters);
        break;
    }

    candidate_choice choice;
    size_t matches = 0;
    for (size_t i = 0; i < perimeters.size(); i++)
    {
        if (std::abs(perimeters[i] - target) <= tie_epsilon)
        {
            if (matches == 0)
                choice.index = i;
            matches++;
        }
    }
    choice.ambiguous = matches > 1;
    return choice;
}

class ResultBuilder
{
  public:
    ResultBuilder(MeasurementKey key, const region_policy &policy, size_t candidate_count)
    {
        _result.key = key;
        _result.facts.candidate_count = candidate_count;
        _id.key = toString(key);
        _id.region = policy.region_name;
        _id.statistic = toString(policy.statistic);
        _id.candidate_count = candidate_count;
    }

    MeasurementResult &result()
    {
        return _result;
    }

    section_id_fields &id()
    {
        return _id;
    }

    void setAxis(const axis_estimate &axis)
    {
        _id.axis = axisName(axis.axis);
        _id.axis_reason = axis.reason.empty() ? "none" : axis.reason;
        _result.facts.axis = _id.axis;
        _result.facts.axis_extent = axis.extent;
    }

    MeasurementResult fail(const char *reason)
    {
        _result.value = NAN;
        _result.method_tag = toString(LoopMethod::NONE);
        _result.failure_reason = reason;
        return finish();
    }

    MeasurementResult finish()
    {
        _result.section_id = makeSectionId(_id);
        spdlog::debug("{}: value {} method {} with {} warnings", _id.key, _result.value, _result.method_tag,
                      _result.warnings.size());
        return std::move(_result);
    }

  private:
    MeasurementResult _result;
    section_id_fields _id;
};
} // namespace

namespace bodymeasure
{

MeasurementResult measureCircumference(const point_cloud &cloud, MeasurementKey key, const measure_options &options)
{
    const region_policy &policy = options.policies[keyIndex(key)];
    validateOptions(options);
    validateFinite(cloud);

    ResultBuilder builder(key, policy, options.num_candidates);
    MeasurementResult &result = builder.result();

    if (cloud.size() < 3)
    {
        result.warnings.emplace_back(codes::INSUFFICIENT_VERTICES);
        return builder.fail(codes::DEGEN_FAIL);
    }

    const axis_estimate axis = estimateAxis(cloud, options);
    builder.setAxis(axis);
    append(result.warnings, axis.warnings);
    if (axis.degenerate)
    {
        return builder.fail(codes::DEGEN_FAIL);
    }

    // candidate heights evenly spaced over the region, the band half width covers the gap between them
    const size_t n = options.num_candidates;
    const double region_width = (policy.end_fraction - policy.start_fraction) * axis.extent;
    const double spacing = n > 1 ? region_width / (n - 1) : 0;
    const double tolerance = options.slice_tolerance > 0
                                 ? options.slice_tolerance
                                 : std::max(spacing / 2, options.min_tolerance_fraction * axis.extent);
    result.facts.slice_tolerance = tolerance;

    const size_t alpha_k = alphaKForCase(options.case_id, options);
    const SliceIndex index(cloud, axis.axis);

    std::vector<section_outcome> outcomes;
    outcomes.reserve(n);
    for (size_t i = 0; i < n; i++)
    {
        const double span = policy.end_fraction - policy.start_fraction;
        const double fraction =
            n > 1 ? policy.start_fraction + span * i / (n - 1) : policy.start_fraction + 0.5 * span;
        SectionPipeline section(index, options, policy, axis.heightAt(fraction), tolerance, alpha_k);
        outcomes.push_back(section.run());
    }

    std::vector<size_t> valid;
    std::vector<double> perimeters;
    for (size_t i = 0; i < outcomes.size(); i++)
    {
        if (outcomes[i].ok())
        {
            valid.push_back(i);
            perimeters.push_back(outcomes[i].perimeter);
        }
    }
    result.facts.valid_candidate_count = valid.size();

    if (valid.empty())
    {
        std::map<std::string, size_t> histogram;
        for (const section_outcome &o : outcomes)
        {
            histogram[o.failure]++;
        }
        result.warnings.emplace_back(codes::EMPTY_CANDIDATES);
        for (const auto &kv : histogram)
        {
            result.warnings.push_back(std::string(codes::CANDIDATE_FAIL) + ":" + kv.first + ":" +
                                      std::to_string(kv.second));
        }
        return builder.fail(codes::DEGEN_FAIL);
    }

    const candidate_choice choice = chooseCandidate(perimeters, policy.statistic, options.tie_epsilon);
    const size_t chosen = valid[choice.index];
    const section_outcome &section = outcomes[chosen];

    append(result.warnings, section.warnings);
    if (valid.size() < n)
    {
        result.warnings.push_back(std::string(codes::CANDIDATES_SKIPPED) + ":" + std::to_string(n - valid.size()));
    }
    if (choice.ambiguous)
    {
        result.warnings.emplace_back(codes::REGION_AMBIGUOUS);
    }
    if (policy.statistic == SelectionStatistic::MIN)
    {
        result.warnings.emplace_back(codes::MIN_SEARCH_USED);
    }
    if (section.perimeter < options.perimeter_small)
    {
        result.warnings.emplace_back(codes::PERIMETER_SMALL);
    }
    else if (section.perimeter > options.perimeter_large)
    {
        result.warnings.emplace_back(codes::PERIMETER_LARGE);
    }

    result.value = section.perimeter;
    result.method_tag = toString(section.method);

    section_facts &facts = result.facts;
    facts.plane_value = section.height;
    facts.height_fraction = (section.height - axis.min) / axis.extent;
    facts.connectivity_distance = section.connectivity_distance;
    facts.candidate_index = static_cast<int64_t>(chosen);
    facts.slice_point_count = section.slice_point_count;
    facts.component_count = section.component_count;
    facts.tiebreak = section.tiebreak;
    facts.loop_point_count = section.loop_point_count;
    facts.loop_area = section.loop_area;
    facts.loop_simple = section.loop_simple;
    facts.loop_approximation = section.loop_approximation;
    facts.shape_ratio = section.loop_area > 1e-10 ? section.perimeter * section.perimeter / section.loop_area : NAN;
    facts.alpha_k = section.alpha_k;
    facts.loop_attempts = section.attempts;

    section_id_fields &id = builder.id();
    id.candidate_index = facts.candidate_index;
    id.plane_value = section.height;
    id.tiebreak = section.tiebreak;
    id.alpha_k = section.alpha_k;

    return builder.finish();
}

MeasurementResult measureCircumference(const point_cloud &cloud, const std::string &key,
                                       const measure_options &options)
{
    return measureCircumference(cloud, measurementKeyFromString(key), options);
}

} // namespace bodymeasure
