#include <bodymeasure/types/point_cloud.hpp>

#include <cmath>
#include <stdexcept>
#include <string>

namespace bodymeasure
{

point_cloud fromFlatBuffer(const std::vector<double> &values, size_t columns)
{
    if (columns != 3)
    {
        throw std::invalid_argument("vertex array must have 3 columns, got " + std::to_string(columns));
    }
    if (values.size() % columns != 0)
    {
        throw std::invalid_argument("vertex buffer of " + std::to_string(values.size()) +
                                    " values is not a whole number of rows");
    }

    point_cloud cloud;
    cloud.reserve(values.size() / columns);
    for (size_t i = 0; i < values.size(); i += columns)
    {
        cloud.emplace_back(values[i], values[i + 1], values[i + 2]);
    }
    validateFinite(cloud);
    return cloud;
}

void validateFinite(const point_cloud &cloud)
{
    for (size_t i = 0; i < cloud.size(); i++)
    {
        if (!cloud[i].allFinite())
        {
            throw std::invalid_argument("vertex " + std::to_string(i) + " has a non-finite coordinate");
        }
    }
}

} // namespace bodymeasure
