#pragma once

#include <string>

namespace bodymeasure
{
namespace codes
{
// terminal
constexpr const char *DEGEN_FAIL = "DEGEN_FAIL";
constexpr const char *TOO_FEW_SLICE_POINTS = "TOO_FEW_SLICE_POINTS";
constexpr const char *EXTRACT_EMPTY = "EXTRACT_EMPTY";
constexpr const char *NOT_CLOSED_LOOP = "NOT_CLOSED_LOOP";

// input and axis
constexpr const char *INSUFFICIENT_VERTICES = "INSUFFICIENT_VERTICES";
constexpr const char *BODY_AXIS_TOO_SHORT = "BODY_AXIS_TOO_SHORT";
constexpr const char *AXIS_TIE = "AXIS_TIE";
constexpr const char *UNIT_FAIL_SCALE_LARGE = "UNIT_FAIL:SCALE_SUSPECTED_LARGE";
constexpr const char *UNIT_FAIL_SCALE_SMALL = "UNIT_FAIL:SCALE_SUSPECTED_SMALL";

// slice and components
constexpr const char *DOWNSAMPLED = "DOWNSAMPLED";
constexpr const char *SINGLE_COMPONENT_ONLY = "SINGLE_COMPONENT_ONLY";
constexpr const char *TORSO_TIEBREAK_USED = "TORSO_TIEBREAK_USED";

// loop reconstruction
constexpr const char *TORSO_FALLBACK_HULL_USED = "TORSO_FALLBACK_HULL_USED";
constexpr const char *TORSO_SINGLE_COMPONENT_FALLBACK_USED = "TORSO_SINGLE_COMPONENT_FALLBACK_USED";

constexpr const char *REASON_TOO_FEW_SLICE_POINTS = "TOO_FEW_SLICE_POINTS";
constexpr const char *REASON_TOO_FEW_COMPONENT_POINTS = "TOO_FEW_COMPONENT_POINTS";
constexpr const char *REASON_TOO_FEW_BOUNDARY_POINTS = "TOO_FEW_BOUNDARY_POINTS";
constexpr const char *REASON_NOT_CLOSED = "NOT_CLOSED";
constexpr const char *REASON_JUMP_SEGMENTS = "JUMP_SEGMENTS";
constexpr const char *REASON_EMPTY_LOOP = "EMPTY_LOOP";
constexpr const char *REASON_NO_CLUSTER = "NO_CLUSTER";
constexpr const char *REASON_DEGENERATE = "DEGENERATE";
constexpr const char *REASON_SINGLE_COMPONENT_ONLY = "SINGLE_COMPONENT_ONLY";
constexpr const char *REASON_EXCEPTION = "EXCEPTION";

// candidate selection
constexpr const char *EMPTY_CANDIDATES = "EMPTY_CANDIDATES";
constexpr const char *CANDIDATES_SKIPPED = "CANDIDATES_SKIPPED";
constexpr const char *CANDIDATE_FAIL = "CANDIDATE_FAIL";
constexpr const char *REGION_AMBIGUOUS = "REGION_AMBIGUOUS";
constexpr const char *MIN_SEARCH_USED = "MIN_SEARCH_USED";
constexpr const char *PERIMETER_SMALL = "PERIMETER_SMALL";
constexpr const char *PERIMETER_LARGE = "PERIMETER_LARGE";

// "ALPHA" + "TOO_FEW_BOUNDARY_POINTS" -> "ALPHA_FAIL:TOO_FEW_BOUNDARY_POINTS"
inline std::string stageFailure(const std::string &stage, const std::string &reason)
{
    return stage + "_FAIL:" + reason;
}

// Text before the first ':' of a code, used to group codes with a variable suffix.
inline std::string family(const std::string &code)
{
    return code.substr(0, code.find(':'));
}
} // namespace codes
} // namespace bodymeasure
