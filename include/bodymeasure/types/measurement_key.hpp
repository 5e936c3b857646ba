#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace bodymeasure
{

enum class MeasurementKey : int32_t
{
    NECK = 0,
    BUST,
    UNDERBUST,
    CHEST,
    WAIST,
    HIP,
    THIGH,
    MIN_CALF,

    __NUM_ENTRIES
};

constexpr size_t NUM_MEASUREMENT_KEYS = static_cast<size_t>(MeasurementKey::__NUM_ENTRIES);

enum class SelectionStatistic
{
    MAX,
    MIN,
    MEDIAN
};

/**
 * Where to look for a measurement and how to pick one candidate among the heights scanned.
 * Fractions are of the body extent along the long axis, measured from its minimum.
 */
struct region_policy
{
    const char *region_name = "";
    double start_fraction = 0;
    double end_fraction = 1;
    SelectionStatistic statistic = SelectionStatistic::MEDIAN;

    // a single component at these heights means the limbs merged with the region of interest
    bool expects_separation = false;
};

using policy_table = std::array<region_policy, NUM_MEASUREMENT_KEYS>;

const policy_table &defaultPolicyTable();

std::array<MeasurementKey, NUM_MEASUREMENT_KEYS> allMeasurementKeys();

std::string toString(MeasurementKey key);
std::string toString(SelectionStatistic statistic);

// Accepts "WAIST" as well as the standard key form "WAIST_CIRC_M". Throws std::invalid_argument otherwise.
MeasurementKey measurementKeyFromString(const std::string &token);

// Throws std::invalid_argument for values outside the enumeration.
size_t keyIndex(MeasurementKey key);

} // namespace bodymeasure
