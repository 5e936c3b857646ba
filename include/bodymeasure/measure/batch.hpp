#pragma once

#include <bodymeasure/types/measure_options.hpp>
#include <bodymeasure/types/measurement_result.hpp>
#include <bodymeasure/types/point_cloud.hpp>

#include <optional>
#include <string>
#include <vector>

namespace bodymeasure
{

struct batch_case
{
    std::string case_id;
    point_cloud cloud;
};

struct batch_outcome
{
    std::string case_id;
    std::string key;

    // empty when the call was aborted by a contract violation
    std::optional<MeasurementResult> result;
    std::string contract_error;
};

/**
 * Measure every key on every case. Outcomes are ordered case-major, in the order of `cases` and `keys`, whatever the
 * parallelism (0 = all processors). A contract violation aborts only its own (case, key) outcome.
 */
std::vector<batch_outcome> runBatch(const std::vector<batch_case> &cases, const std::vector<std::string> &keys,
                                    const measure_options &options, size_t parallelism = 0);

} // namespace bodymeasure
