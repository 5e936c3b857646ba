#include <bodymeasure/types/measurement_key.hpp>

#include <stdexcept>

namespace bodymeasure
{

const policy_table &defaultPolicyTable()
{
    // clang-format off
    static const policy_table table{{
        /* NECK      */ {"neck",           0.75, 0.90, SelectionStatistic::MEDIAN, false},
        /* BUST      */ {"upper_torso",    0.40, 0.70, SelectionStatistic::MAX,    true},
        /* UNDERBUST */ {"lower_thoracic", 0.30, 0.60, SelectionStatistic::MEDIAN, true},
        /* CHEST     */ {"upper_torso",    0.40, 0.70, SelectionStatistic::MEDIAN, true},
        /* WAIST     */ {"mid_torso",      0.40, 0.70, SelectionStatistic::MIN,    true},
        /* HIP       */ {"lower_torso",    0.50, 0.80, SelectionStatistic::MAX,    true},
        /* THIGH     */ {"upper_leg",      0.20, 0.40, SelectionStatistic::MAX,    false},
        /* MIN_CALF  */ {"lower_leg",      0.05, 0.20, SelectionStatistic::MIN,    false},
    }};
    // clang-format on
    return table;
}

std::array<MeasurementKey, NUM_MEASUREMENT_KEYS> allMeasurementKeys()
{
    std::array<MeasurementKey, NUM_MEASUREMENT_KEYS> keys;
    for (size_t i = 0; i < keys.size(); i++)
    {
        keys[i] = static_cast<MeasurementKey>(i);
    }
    return keys;
}

size_t keyIndex(MeasurementKey key)
{
    const auto index = static_cast<int32_t>(key);
    if (index < 0 || index >= static_cast<int32_t>(NUM_MEASUREMENT_KEYS))
    {
        throw std::invalid_argument("measurement key value " + std::to_string(index) + " is not in the enumeration");
    }
    return static_cast<size_t>(index);
}

std::string toString(MeasurementKey key)
{
    switch (key)
    {
    case MeasurementKey::NECK:
        return "NECK";
    case MeasurementKey::BUST:
        return "BUST";
    case MeasurementKey::UNDERBUST:
        return "UNDERBUST";
    case MeasurementKey::CHEST:
        return "CHEST";
    case MeasurementKey::WAIST:
        return "WAIST";
    case MeasurementKey::HIP:
        return "HIP";
    case MeasurementKey::THIGH:
        return "THIGH";
    case MeasurementKey::MIN_CALF:
        return "MIN_CALF";
    case MeasurementKey::__NUM_ENTRIES:
        break;
    }
    return "UNKNOWN";
}

std::string toString(SelectionStatistic statistic)
{
    switch (statistic)
    {
    case SelectionStatistic::MAX:
        return "max";
    case SelectionStatistic::MIN:
        return "min";
    case SelectionStatistic::MEDIAN:
        return "median";
    }
    return "unknown";
}

MeasurementKey measurementKeyFromString(const std::string &token)
{
    static const std::string suffix = "_CIRC_M";
    std::string name = token;
    if (name.size() > suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0)
    {
        name.resize(name.size() - suffix.size());
    }

    for (MeasurementKey key : allMeasurementKeys())
    {
        if (toString(key) == name)
        {
            return key;
        }
    }
    throw std::invalid_argument("unknown measurement key '" + token + "'");
}

} // namespace bodymeasure
