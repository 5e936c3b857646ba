#include <bodymeasure/io/serialize.hpp>

#define RAPIDJSON_WRITE_DEFAULT_FLAGS kWriteNanAndInfFlag
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <spdlog/spdlog.h>

#include <ostream>

namespace
{
using namespace bodymeasure;

template <typename Writer> void writeOptionalSize(Writer &writer, const std::optional<size_t> &value)
{
    if (value.has_value())
        writer.Uint64(*value);
    else
        writer.Null();
}

template <typename Writer> void writeFacts(Writer &writer, const section_facts &facts)
{
    writer.StartObject();
    writer.Key("axis");
    writer.String(facts.axis.c_str());
    writer.Key("axis_extent");
    writer.Double(facts.axis_extent);
    writer.Key("plane_value");
    writer.Double(facts.plane_value);
    writer.Key("height_fraction");
    writer.Double(facts.height_fraction);
    writer.Key("slice_tolerance");
    writer.Double(facts.slice_tolerance);
    writer.Key("connectivity_distance");
    writer.Double(facts.connectivity_distance);
    writer.Key("candidate_count");
    writer.Uint64(facts.candidate_count);
    writer.Key("valid_candidate_count");
    writer.Uint64(facts.valid_candidate_count);
    writer.Key("candidate_index");
    writer.Int64(facts.candidate_index);
    writer.Key("slice_point_count");
    writer.Uint64(facts.slice_point_count);
    writer.Key("component_count");
    writer.Uint64(facts.component_count);
    writer.Key("tiebreak");
    writer.String(facts.tiebreak.c_str());
    writer.Key("loop_point_count");
    writer.Uint64(facts.loop_point_count);
    writer.Key("loop_area_m2");
    writer.Double(facts.loop_area);
    writer.Key("loop_simple");
    writer.Bool(facts.loop_simple);
    writer.Key("loop_approximation");
    writer.Bool(facts.loop_approximation);
    writer.Key("shape_ratio");
    writer.Double(facts.shape_ratio);
    writer.Key("alpha_k");
    writeOptionalSize(writer, facts.alpha_k);

    writer.Key("loop_attempts");
    writer.StartArray();
    for (const loop_attempt_record &attempt : facts.loop_attempts)
    {
        writer.StartObject();
        writer.Key("strategy");
        writer.String(attempt.strategy.c_str());
        writer.Key("code");
        if (attempt.code.empty())
            writer.Null();
        else
            writer.String(attempt.code.c_str());
        writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();
}

template <typename Writer> void writeOutcome(Writer &writer, const batch_outcome &outcome)
{
    writer.StartObject();
    writer.Key("case_id");
    writer.String(outcome.case_id.c_str());
    writer.Key("key");
    writer.String(outcome.key.c_str());

    if (!outcome.result.has_value())
    {
        writer.Key("contract_error");
        writer.String(outcome.contract_error.c_str());
        writer.EndObject();
        return;
    }

    const MeasurementResult &result = *outcome.result;
    writer.Key("circumference_m");
    writer.Double(result.value);
    writer.Key("section_id");
    writer.String(result.section_id.c_str());
    writer.Key("method_tag");
    writer.String(result.method_tag.c_str());

    writer.Key("warnings");
    writer.StartArray();
    for (const std::string &w : result.warnings)
    {
        writer.String(w.c_str());
    }
    writer.EndArray();

    writer.Key("failure_reason");
    if (result.failure_reason.has_value())
        writer.String(result.failure_reason->c_str());
    else
        writer.Null();

    writer.Key("facts");
    writeFacts(writer, result.facts);
    writer.EndObject();
}

template <typename Writer> void writeCounts(Writer &writer, const char *name, const std::map<std::string, size_t> &m)
{
    writer.Key(name);
    writer.StartObject();
    for (const auto &kv : m)
    {
        writer.Key(kv.first.c_str());
        writer.Uint64(kv.second);
    }
    writer.EndObject();
}
} // namespace

namespace bodymeasure
{

bool toJsonLine(const batch_outcome &outcome, std::ostream &out)
{
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writeOutcome(writer, outcome);

    if (!writer.IsComplete())
    {
        spdlog::error("incomplete JSON for case {} key {}", outcome.case_id, outcome.key);
        return false;
    }
    out << buffer.GetString() << "\n";
    return out.good();
}

bool toJsonLines(const std::vector<batch_outcome> &outcomes, std::ostream &out)
{
    for (const batch_outcome &outcome : outcomes)
    {
        if (!toJsonLine(outcome, out))
        {
            return false;
        }
    }
    return true;
}

bool toJson(const facts_summary &summary, std::ostream &out)
{
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetFormatOptions(rapidjson::PrettyFormatOptions::kFormatSingleLineArray);

    writer.StartObject();
    writer.Key("total");
    writer.Uint64(summary.total);
    writer.Key("processed");
    writer.Uint64(summary.processed);
    writer.Key("contract_violations");
    writer.Uint64(summary.contract_violations);

    writer.Key("keys");
    writer.StartObject();
    for (const auto &kv : summary.per_key)
    {
        writer.Key(kv.first.c_str());
        writer.StartObject();
        writer.Key("processed");
        writer.Uint64(kv.second.processed);
        writer.Key("nan_count");
        writer.Uint64(kv.second.nan_count);
        writer.Key("nan_rate");
        writer.Double(kv.second.nanRate());
        writer.EndObject();
    }
    writer.EndObject();

    writeCounts(writer, "warning_codes", summary.warning_codes);
    writeCounts(writer, "warning_families", summary.warning_families);
    writeCounts(writer, "failure_reasons", summary.failure_reasons);
    writeCounts(writer, "method_usage", summary.method_usage);
    writer.EndObject();

    if (!writer.IsComplete())
    {
        spdlog::error("incomplete facts summary JSON");
        return false;
    }
    out << buffer.GetString() << "\n";
    return out.good();
}

} // namespace bodymeasure
