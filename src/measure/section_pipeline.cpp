#include <bodymeasure/measure/section_pipeline.hpp>

#include <bodymeasure/geometry/polygon.hpp>
#include <bodymeasure/select/region_selector.hpp>
#include <bodymeasure/types/warning_codes.hpp>

#include <spdlog/spdlog.h>

namespace bodymeasure
{

SectionPipeline::SectionPipeline(const SliceIndex &index, const measure_options &options,
                                 const region_policy &policy, double height, double tolerance, size_t alpha_k)
    : usm::StateMachine<SectionState, SectionTransition>(SectionState::SLICE), _index(index), _options(options),
      _policy(policy), _tolerance(tolerance), _alpha_k(alpha_k)
{
    _outcome.height = height;
}

const section_outcome &SectionPipeline::run()
{
    while (getState() != SectionState::COMPLETE && getState() != SectionState::FAILED)
    {
        iterateOnce();
    }
    return _outcome;
}

SectionState SectionPipeline::chooseNextState(SectionState currentState, SectionTransition transition)
{
    if (transition == Transition::ERROR)
    {
        return State::FAILED;
    }

    switch (currentState)
    {
    case State::SLICE:
        return State::SEPARATE_COMPONENTS;
    case State::SEPARATE_COMPONENTS:
        return State::SELECT_REGION;
    case State::SELECT_REGION:
        return State::RECONSTRUCT_LOOP;
    case State::RECONSTRUCT_LOOP:
        return State::COMPUTE_PERIMETER;
    case State::COMPUTE_PERIMETER:
        return State::COMPLETE;
    case State::COMPLETE:
    case State::FAILED:
        break;
    }
    return currentState;
}

SectionPipeline::Transition SectionPipeline::runCurrentState(SectionState currentState)
{
    spdlog::trace("section at {}: running {}", _outcome.height, toString(currentState));

    switch (currentState)
    {
    case State::SLICE:
        return slice();
    case State::SEPARATE_COMPONENTS:
        return separate_components();
    case State::SELECT_REGION:
        return select_region();
    case State::RECONSTRUCT_LOOP:
        return reconstruct_loop();
    case State::COMPUTE_PERIMETER:
        return compute_perimeter();
    case State::COMPLETE:
    case State::FAILED:
        break;
    }
    return Transition::REPEAT;
}

SectionPipeline::Transition SectionPipeline::fail(const char *code)
{
    _outcome.failure = code;
    return Transition::ERROR;
}

SectionPipeline::Transition SectionPipeline::slice()
{
    _band = _index.slice(_outcome.height, _tolerance, _options.max_slice_points);
    _outcome.slice_point_count = _band.points.size();
    if (_band.downsampled)
    {
        _outcome.warnings.emplace_back(codes::DOWNSAMPLED);
    }

    if (_band.points.size() < _options.min_slice_points)
    {
        return fail(codes::TOO_FEW_SLICE_POINTS);
    }
    return Transition::NEXT;
}

SectionPipeline::Transition SectionPipeline::separate_components()
{
    _separation = separateComponents(_band.points, _options);
    _outcome.component_count = _separation.components.size();
    _outcome.connectivity_distance = _separation.threshold;

    if (_separation.components.empty())
    {
        return fail(codes::EXTRACT_EMPTY);
    }
    return Transition::NEXT;
}

SectionPipeline::Transition SectionPipeline::select_region()
{
    const region_selection selection = selectRegion(_separation.components, _options.tie_epsilon);
    _selected = selection.index;
    _outcome.tiebreak = selection.criterion;

    if (selection.single_component && _policy.expects_separation)
    {
        _single_component_forced = true;
        _outcome.warnings.emplace_back(codes::SINGLE_COMPONENT_ONLY);
    }
    if (selection.tiebreakUsed())
    {
        _outcome.warnings.emplace_back(codes::TORSO_TIEBREAK_USED);
    }
    return Transition::NEXT;
}

SectionPipeline::Transition SectionPipeline::reconstruct_loop()
{
    const loop_input input{_separation.components[_selected], _separation.slice_centroid, _band.points.size(),
                           _single_component_forced, _alpha_k, _options};
    _reconstruction = reconstructLoop(input);

    _outcome.attempts = _reconstruction.attempts;
    _outcome.warnings.insert(_outcome.warnings.end(), _reconstruction.warnings.begin(),
                             _reconstruction.warnings.end());

    if (!_reconstruction.ok())
    {
        return fail(codes::NOT_CLOSED_LOOP);
    }
    _outcome.method = _reconstruction.method;
    _outcome.alpha_k = _reconstruction.alpha_k;
    return Transition::NEXT;
}

SectionPipeline::Transition SectionPipeline::compute_perimeter()
{
    const points_2d loop = mergeNearDuplicates(_reconstruction.loop.points, _options.dedupe_epsilon);
    const double perimeter = polygonPerimeter(loop);
    if (loop.size() < 3 || !(perimeter > 0) || !std::isfinite(perimeter))
    {
        _outcome.method = LoopMethod::NONE;
        return fail(codes::NOT_CLOSED_LOOP);
    }

    _outcome.perimeter = perimeter;
    _outcome.loop_point_count = loop.size();
    _outcome.loop_area = polygonArea(loop);
    _outcome.loop_simple = _reconstruction.loop.simple;
    _outcome.loop_approximation = _reconstruction.loop.approximation;
    spdlog::debug("section at {}: perimeter {} by {}", _outcome.height, perimeter,
                  bodymeasure::toString(_outcome.method));
    return Transition::NEXT;
}

std::string SectionPipeline::toString(SectionState state)
{
    switch (state)
    {
    case SectionState::SLICE:
        return "Slice";
    case SectionState::SEPARATE_COMPONENTS:
        return "Separate components";
    case SectionState::SELECT_REGION:
        return "Select region";
    case SectionState::RECONSTRUCT_LOOP:
        return "Reconstruct loop";
    case SectionState::COMPUTE_PERIMETER:
        return "Compute perimeter";
    case SectionState::COMPLETE:
        return "Complete";
    case SectionState::FAILED:
        return "Failed";
    };

    return "Error";
}

} // namespace bodymeasure
