#include <bodymeasure/facts/facts_summary.hpp>

#include <bodymeasure/types/warning_codes.hpp>

namespace bodymeasure
{

facts_summary summarizeFacts(const std::vector<batch_outcome> &outcomes)
{
    facts_summary summary;
    summary.total = outcomes.size();

    for (const batch_outcome &outcome : outcomes)
    {
        if (!outcome.result.has_value())
        {
            summary.contract_violations++;
            continue;
        }

        const MeasurementResult &result = *outcome.result;
        summary.processed++;

        key_facts &key = summary.per_key[toString(result.key)];
        key.processed++;
        if (!result.defined())
        {
            key.nan_count++;
        }

        for (const std::string &w : result.warnings)
        {
            summary.warning_codes[w]++;
            summary.warning_families[codes::family(w)]++;
        }
        if (result.failure_reason.has_value())
        {
            summary.failure_reasons[*result.failure_reason]++;
        }
        summary.method_usage[result.method_tag]++;
    }
    return summary;
}

} // namespace bodymeasure
