#pragma once

#include <bodymeasure/measure/batch.hpp>

#include <map>
#include <string>

namespace bodymeasure
{

struct key_facts
{
    size_t processed = 0;
    size_t nan_count = 0;

    double nanRate() const
    {
        return processed == 0 ? NAN : static_cast<double>(nan_count) / processed;
    }
};

/**
 * Counts over a batch of outcomes, facts only. Every processed result contributes exactly one method tag, so the
 * method usage counts sum to `processed`.
 */
struct facts_summary
{
    size_t total = 0;
    size_t processed = 0;
    size_t contract_violations = 0;

    std::map<std::string, key_facts> per_key;
    std::map<std::string, size_t> warning_codes;
    std::map<std::string, size_t> warning_families;
    std::map<std::string, size_t> failure_reasons;
    std::map<std::string, size_t> method_usage;
};

facts_summary summarizeFacts(const std::vector<batch_outcome> &outcomes);

} // namespace bodymeasure
