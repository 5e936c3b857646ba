#include <bodymeasure/measure/section_id.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace bodymeasure
{

std::string makeSectionId(const section_id_fields &fields)
{
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    // keys in lexicographic order
    writer.StartObject();
    writer.Key("alpha_k");
    if (fields.alpha_k.has_value())
        writer.Uint64(*fields.alpha_k);
    else
        writer.Null();
    writer.Key("axis");
    writer.String(fields.axis.c_str());
    writer.Key("axis_reason");
    writer.String(fields.axis_reason.c_str());
    writer.Key("candidate_count");
    writer.Uint64(fields.candidate_count);
    writer.Key("candidate_index");
    writer.Int64(fields.candidate_index);
    writer.Key("key");
    writer.String(fields.key.c_str());
    writer.Key("plane_value");
    if (std::isfinite(fields.plane_value))
        writer.Double(fields.plane_value);
    else
        writer.Null();
    writer.Key("region");
    writer.String(fields.region.c_str());
    writer.Key("statistic");
    writer.String(fields.statistic.c_str());
    writer.Key("tiebreak");
    writer.String(fields.tiebreak.c_str());
    writer.EndObject();

    return buffer.GetString();
}

} // namespace bodymeasure
