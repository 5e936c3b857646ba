#pragma once

#include <bodymeasure/types/point_cloud.hpp>

#include <iosfwd>
#include <string>
#include <vector>

namespace bodymeasure
{
/**
 * Read "x,y,z" lines (commas or whitespace between values, '#' starts a comment, blank lines ignored).
 * Throws std::invalid_argument for a row that does not have exactly 3 numeric values or a non-finite value.
 * Values are taken as they are, no unit conversion.
 */
point_cloud fromXYZ(std::istream &in);

// Returns false if the file cannot be opened; contract violations in its content still throw.
bool loadXYZ(const std::string &path, point_cloud &cloud);

// The path itself for a file, or the sorted ".xyz" regular files of a directory.
std::vector<std::string> listXYZInputs(const std::string &path);
} // namespace bodymeasure
