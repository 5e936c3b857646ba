#pragma once

#include <bodymeasure/geometry/components.hpp>
#include <bodymeasure/geometry/slice.hpp>
#include <bodymeasure/loop/reconstruct_loop.hpp>
#include <bodymeasure/types/measure_options.hpp>

#include <usm.hpp>

#include <string>
#include <vector>

namespace bodymeasure
{

enum class SectionState
{
    SLICE,
    SEPARATE_COMPONENTS,
    SELECT_REGION,
    RECONSTRUCT_LOOP,
    COMPUTE_PERIMETER,
    COMPLETE,
    FAILED
};

enum class SectionTransition
{
    REPEAT,
    NEXT,
    ERROR
};

struct section_outcome
{
    double height = NAN;
    double perimeter = NAN;

    // TOO_FEW_SLICE_POINTS, EXTRACT_EMPTY or NOT_CLOSED_LOOP, empty when a perimeter was found
    std::string failure;
    std::vector<std::string> warnings;

    size_t slice_point_count = 0;
    size_t component_count = 0;
    double connectivity_distance = NAN;
    std::string tiebreak = "none";

    LoopMethod method = LoopMethod::NONE;
    size_t loop_point_count = 0;
    double loop_area = NAN;
    bool loop_simple = false;
    bool loop_approximation = false;
    std::optional<size_t> alpha_k;
    std::vector<loop_attempt_record> attempts;

    bool ok() const
    {
        return failure.empty();
    }
};

/**
 * Cross-section at one candidate height: slice, separate components, select the region, reconstruct its loop and
 * measure it. Every state either hands a usable intermediate to the next one or fails with a terminal code.
 */
class SectionPipeline : public usm::StateMachine<SectionState, SectionTransition>
{
  public:
    SectionPipeline(const SliceIndex &index, const measure_options &options, const region_policy &policy,
                    double height, double tolerance, size_t alpha_k);

    // iterate until COMPLETE or FAILED
    const section_outcome &run();

    const section_outcome &outcome() const
    {
        return _outcome;
    }

    static std::string toString(SectionState state);

  protected:
    SectionState chooseNextState(SectionState currentState, SectionTransition transition) override;
    SectionTransition runCurrentState(SectionState currentState) override;

  private:
    SectionTransition slice();
    SectionTransition separate_components();
    SectionTransition select_region();
    SectionTransition reconstruct_loop();
    SectionTransition compute_perimeter();

    SectionTransition fail(const char *code);

    const SliceIndex &_index;
    const measure_options &_options;
    const region_policy &_policy;
    double _tolerance;
    size_t _alpha_k;

    slice_band _band;
    component_separation _separation;
    int64_t _selected = -1;
    bool _single_component_forced = false;
    loop_reconstruction _reconstruction;

    section_outcome _outcome;
};

} // namespace bodymeasure
