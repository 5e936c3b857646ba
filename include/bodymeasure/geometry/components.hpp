#pragma once

#include <bodymeasure/types/closed_loop.hpp>
#include <bodymeasure/types/measure_options.hpp>

#include <vector>

namespace bodymeasure
{

/**
 * Undirected proximity graph in compressed adjacency form: the neighbours of point i are
 * neighbours[offsets[i] .. offsets[i + 1]), ascending.
 */
struct proximity_graph
{
    std::vector<size_t> offsets;
    std::vector<size_t> neighbours;
    double threshold = 0;

    size_t size() const
    {
        return offsets.empty() ? 0 : offsets.size() - 1;
    }

    size_t degree(size_t i) const
    {
        return offsets[i + 1] - offsets[i];
    }
};

/**
 * Edge length for the proximity graph: the configured absolute distance, or the spacing factor times the median
 * nearest neighbour spacing of the slice. NaN if the slice has no two distinct points.
 */
double connectivityThreshold(const points_2d &points, const measure_options &options);

proximity_graph buildProximityGraph(const points_2d &points, double threshold);

struct component_separation
{
    std::vector<slice_component> components; // ordered by lowest member index
    size_t discarded_points = 0;             // members of clusters below min_component_points
    double threshold = 0;
    Eigen::Vector2d slice_centroid{NAN, NAN};
};

/**
 * Connected components of the proximity graph over the (canonically ordered) slice points. Each surviving component
 * gets its centroid, the distance from it to the centroid of the whole slice, and the area and perimeter of its
 * polar-angle loop for tie-breaking.
 */
component_separation separateComponents(const points_2d &points, const measure_options &options);

} // namespace bodymeasure
