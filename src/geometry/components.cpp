#include <bodymeasure/geometry/components.hpp>

#include <bodymeasure/geometry/point_tree.hpp>
#include <bodymeasure/geometry/polygon.hpp>
#include <bodymeasure/geometry/slice.hpp>
#include <bodymeasure/geometry/union_find.hpp>

#include <spdlog/spdlog.h>

#include <map>

namespace bodymeasure
{

double connectivityThreshold(const points_2d &points, const measure_options &options)
{
    if (options.connectivity_distance > 0)
    {
        return options.connectivity_distance;
    }
    const point_tree_2d tree = buildPointTree(points);
    return options.connectivity_spacing_factor * medianNeighbourSpacing(points, tree, options.dedupe_epsilon);
}

proximity_graph buildProximityGraph(const points_2d &points, double threshold)
{
    proximity_graph graph;
    graph.threshold = threshold;
    graph.offsets.reserve(points.size() + 1);
    graph.offsets.push_back(0);

    const point_tree_2d tree = buildPointTree(points);
    for (size_t i = 0; i < points.size(); i++)
    {
        if (std::isfinite(threshold) && threshold > 0)
        {
            for (size_t j : neighboursWithin(tree, points[i], threshold))
            {
                if (j != i)
                {
                    graph.neighbours.push_back(j);
                }
            }
        }
        graph.offsets.push_back(graph.neighbours.size());
    }
    return graph;
}

component_separation separateComponents(const points_2d &points, const measure_options &options)
{
    component_separation separation;
    separation.slice_centroid = centroidOf(points);
    separation.threshold = connectivityThreshold(points, options);

    const proximity_graph graph = buildProximityGraph(points, separation.threshold);

    UnionFind sets(points.size());
    for (size_t i = 0; i < graph.size(); i++)
    {
        for (size_t k = graph.offsets[i]; k < graph.offsets[i + 1]; k++)
        {
            sets.unite(i, graph.neighbours[k]);
        }
    }

    // representatives are the lowest member index, so iterating the map gives canonical component order
    std::map<size_t, std::vector<size_t>> members;
    for (size_t i = 0; i < points.size(); i++)
    {
        members[sets.find(i)].push_back(i);
    }

    for (const auto &kv : members)
    {
        if (kv.second.size() < options.min_component_points)
        {
            separation.discarded_points += kv.second.size();
            continue;
        }

        slice_component component;
        component.first_index = kv.first;
        component.points.reserve(kv.second.size());
        for (size_t i : kv.second)
        {
            component.points.push_back(points[i]);
        }
        component.centroid = centroidOf(component.points);
        component.centerline_distance = (component.centroid - separation.slice_centroid).norm();

        const points_2d loop = polarOrder(component.points, component.centroid, options.dedupe_epsilon);
        if (loop.size() >= 3)
        {
            component.area = polygonArea(loop);
            component.perimeter = polygonPerimeter(loop);
        }
        separation.components.push_back(std::move(component));
    }

    spdlog::trace("{} points, threshold {}: {} components, {} points discarded", points.size(), separation.threshold,
                  separation.components.size(), separation.discarded_points);
    return separation;
}

} // namespace bodymeasure
