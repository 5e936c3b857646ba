#pragma once

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>

namespace bodymeasure
{

struct section_id_fields
{
    std::string key;
    std::string region;
    std::string statistic;
    std::string axis = "none";
    std::string axis_reason = "none";
    size_t candidate_count = 0;
    int64_t candidate_index = -1;
    double plane_value = NAN;
    std::string tiebreak = "none";
    std::optional<size_t> alpha_k;
};

// Compact JSON object with sorted keys, non-finite numbers written as null.
std::string makeSectionId(const section_id_fields &fields);

} // namespace bodymeasure
