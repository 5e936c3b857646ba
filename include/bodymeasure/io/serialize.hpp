#pragma once

#include <bodymeasure/facts/facts_summary.hpp>
#include <bodymeasure/measure/batch.hpp>

#include <iosfwd>

namespace bodymeasure
{
// One compact JSON object per line.
bool toJsonLines(const std::vector<batch_outcome> &outcomes, std::ostream &out);

bool toJsonLine(const batch_outcome &outcome, std::ostream &out);

bool toJson(const facts_summary &summary, std::ostream &out);
} // namespace bodymeasure
