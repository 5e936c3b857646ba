#pragma once

#include <bodymeasure/types/measure_options.hpp>
#include <bodymeasure/types/measurement_result.hpp>
#include <bodymeasure/types/point_cloud.hpp>

namespace bodymeasure
{

/**
 * Circumference for one measurement key. Scans the key's height region, reconstructs a cross-section loop at each
 * candidate height and picks one candidate by the key's statistic.
 *
 * Geometric degeneracy is reported on the result (NaN value, failure_reason and warnings). Throws
 * std::invalid_argument only for contract violations: non-finite coordinates, a key outside the enumeration or
 * unusable options.
 */
MeasurementResult measureCircumference(const point_cloud &cloud, MeasurementKey key,
                                       const measure_options &options = {});

// Same as above, with the key given as a token such as "WAIST" or "WAIST_CIRC_M".
MeasurementResult measureCircumference(const point_cloud &cloud, const std::string &key,
                                       const measure_options &options = {});

} // namespace bodymeasure
