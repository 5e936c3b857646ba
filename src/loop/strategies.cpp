#include <bodymeasure/loop/strategies.hpp>

#include <bodymeasure/geometry/point_tree.hpp>
#include <bodymeasure/geometry/polygon.hpp>
#include <bodymeasure/geometry/slice.hpp>
#include <bodymeasure/geometry/utils.hpp>
#include <bodymeasure/types/warning_codes.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <deque>

namespace
{
using namespace bodymeasure;

// empty when the ordered loop is acceptable
std::string checkOrderedLoop(const points_2d &loop, const Eigen::Vector2d &center, const measure_options &options,
                             bool check_jumps)
{
    if (loop.size() < options.min_loop_points)
    {
        return codes::REASON_TOO_FEW_BOUNDARY_POINTS;
    }
    if (maxAngularGap(loop, center) >= M_PI)
    {
        return codes::REASON_NOT_CLOSED;
    }
    if (check_jumps)
    {
        const double mean_edge = polygonPerimeter(loop) / loop.size();
        for (size_t i = 0; i < loop.size(); i++)
        {
            if ((loop[(i + 1) % loop.size()] - loop[i]).norm() > options.jump_factor * mean_edge)
            {
                return codes::REASON_JUMP_SEGMENTS;
            }
        }
    }
    return "";
}

// a polar ordered loop with strictly increasing angles is star-shaped around the center, hence simple
bool strictlyIncreasingAngles(const points_2d &loop, const Eigen::Vector2d &center)
{
    double previous = -INFINITY;
    for (const Eigen::Vector2d &p : loop)
    {
        const double angle = std::atan2(p.y() - center.y(), p.x() - center.x());
        if (!(angle > previous))
            return false;
        previous = angle;
    }
    return true;
}

// a boundary built from part of the component must still go around the component centre and span most of its
// outline, otherwise it is a fragment and not a closed loop
bool coversComponent(const points_2d &ordered, const loop_input &input)
{
    if (maxAngularGap(ordered, input.component.centroid) >= M_PI)
    {
        return false;
    }
    const points_2d hull = convexHull(input.component.points);
    return hull.empty() ||
           polygonPerimeter(ordered) >= input.options.min_hull_perimeter_fraction * polygonPerimeter(hull);
}

strategy_result orderedLoop(LoopMethod method, const points_2d &points, const loop_input &input, bool check_jumps)
{
    const Eigen::Vector2d &center = input.component.centroid;
    points_2d ordered = polarOrder(points, center, input.options.dedupe_epsilon);
    std::string reason = checkOrderedLoop(ordered, center, input.options, check_jumps);
    if (reason.empty() && !coversComponent(ordered, input))
    {
        reason = codes::REASON_NOT_CLOSED;
    }
    if (!reason.empty())
    {
        return strategy_result::failure(reason);
    }

    strategy_result result;
    result.method = method;
    result.loop.simple = strictlyIncreasingAngles(ordered, center);
    result.loop.points = std::move(ordered);
    return result;
}

// points whose k-th neighbour distance is above the threshold derived from all distances (or equal to it when
// inclusive); all points when there are too few to rank
template <typename Threshold>
points_2d neighbourhoodBoundary(const points_2d &points, size_t k, Threshold threshold, bool inclusive)
{
    const size_t k_actual = std::min(k + 1, points.size());
    if (points.size() <= k_actual)
    {
        return points;
    }

    const point_tree_2d tree = buildPointTree(points);
    const std::vector<double> distances = kthNeighbourDistances(points, tree, k);
    const double t = threshold(distances);

    points_2d boundary;
    for (size_t i = 0; i < points.size(); i++)
    {
        if (distances[i] > t || (inclusive && distances[i] == t))
        {
            boundary.push_back(points[i]);
        }
    }
    return boundary;
}

strategy_result boundaryLoop(LoopMethod method, const points_2d &boundary, const loop_input &input)
{
    const measure_options &options = input.options;
    if (boundary.size() < std::max<size_t>(3, options.min_loop_points))
    {
        return strategy_result::failure(codes::REASON_TOO_FEW_BOUNDARY_POINTS);
    }

    const Eigen::Vector2d &center = input.component.centroid;
    points_2d ordered = polarOrder(boundary, center, options.dedupe_epsilon);
    if (ordered.size() < 3 || !(polygonPerimeter(ordered) > 0))
    {
        return strategy_result::failure(codes::REASON_EMPTY_LOOP);
    }
    if (!coversComponent(ordered, input))
    {
        return strategy_result::failure(codes::REASON_NOT_CLOSED);
    }

    strategy_result result;
    result.method = method;
    result.loop.simple = strictlyIncreasingAngles(ordered, center);
    result.loop.points = std::move(ordered);
    return result;
}

const loop_attempt_record *findAttempt(const std::vector<loop_attempt_record> &attempts, const std::string &name)
{
    for (const loop_attempt_record &a : attempts)
    {
        if (a.strategy == name)
            return &a;
    }
    return nullptr;
}

bool alphaRanOutOfBoundary(const std::vector<loop_attempt_record> &attempts)
{
    const loop_attempt_record *alpha = findAttempt(attempts, "alpha_shape");
    return alpha != nullptr &&
           alpha->code == codes::stageFailure("ALPHA", codes::REASON_TOO_FEW_BOUNDARY_POINTS);
}
} // namespace

namespace bodymeasure
{

size_t alphaKForCase(const std::string &case_id, const measure_options &options)
{
    if (case_id.empty())
    {
        return options.alpha_default_k;
    }
    uint64_t hash = 14695981039346656037ull;
    for (unsigned char c : case_id)
    {
        hash ^= c;
        hash *= 1099511628211ull;
    }
    return options.alpha_k_choices[hash % options.alpha_k_choices.size()];
}

strategy_result polarAngleLoop(const loop_input &input)
{
    if (input.single_component_forced)
    {
        return strategy_result::failure(codes::REASON_SINGLE_COMPONENT_ONLY);
    }
    if (input.component.points.size() < input.options.min_loop_points)
    {
        return strategy_result::failure(codes::REASON_TOO_FEW_COMPONENT_POINTS);
    }
    return orderedLoop(LoopMethod::POLAR_ANGLE, input.component.points, input, true);
}

strategy_result alphaShapeLoop(const loop_input &input, size_t k)
{
    if (input.slice_point_count < 3)
    {
        return strategy_result::failure(codes::REASON_TOO_FEW_SLICE_POINTS);
    }
    const points_2d &points = input.component.points;
    if (points.size() < 3)
    {
        return strategy_result::failure(codes::REASON_TOO_FEW_COMPONENT_POINTS);
    }

    const double ratio = input.options.alpha_boundary_ratio;
    const points_2d boundary = neighbourhoodBoundary(
        points, k, [ratio](const std::vector<double> &d) { return ratio * lowerMedian(d); }, false);

    strategy_result result = boundaryLoop(LoopMethod::ALPHA_SHAPE, boundary, input);
    result.alpha_k = k;
    return result;
}

strategy_result secondaryBoundaryLoop(const loop_input &input)
{
    const points_2d &points = input.component.points;
    if (points.size() < 3)
    {
        return strategy_result::failure(codes::REASON_TOO_FEW_COMPONENT_POINTS);
    }

    const size_t k = std::min<size_t>(3, points.size() - 1);
    const double pct = input.options.secondary_percentile;
    const points_2d boundary = neighbourhoodBoundary(
        points, k, [pct](const std::vector<double> &d) { return percentile(d, pct); }, true);

    return boundaryLoop(LoopMethod::SECONDARY_BOUNDARY, boundary, input);
}

strategy_result clusterTrimLoop(const loop_input &input)
{
    const measure_options &options = input.options;
    const points_2d &points = input.component.points;
    if (points.size() < 3)
    {
        return strategy_result::failure(codes::REASON_TOO_FEW_COMPONENT_POINTS);
    }

    const point_tree_2d tree = buildPointTree(points);
    const size_t k = std::min(options.cluster_min_samples, points.size() - 1);
    const double eps = options.cluster_eps_factor * lowerMedian(kthNeighbourDistances(points, tree, k));
    if (!(eps > 0))
    {
        return strategy_result::failure(codes::REASON_NO_CLUSTER);
    }

    // DBSCAN in canonical point order, core points have at least min_samples points (self included) within eps
    constexpr int64_t UNASSIGNED = -1;
    std::vector<int64_t> labels(points.size(), UNASSIGNED);
    std::vector<std::vector<size_t>> clusters;
    for (size_t seed = 0; seed < points.size(); seed++)
    {
        if (labels[seed] != UNASSIGNED)
            continue;
        std::vector<size_t> seed_neighbours = neighboursWithin(tree, points[seed], eps);
        if (seed_neighbours.size() < options.cluster_min_samples)
            continue;

        const int64_t label = static_cast<int64_t>(clusters.size());
        clusters.emplace_back();
        std::deque<size_t> queue{seed};
        labels[seed] = label;
        while (!queue.empty())
        {
            const size_t i = queue.front();
            queue.pop_front();
            clusters.back().push_back(i);

            const std::vector<size_t> neighbours = i == seed ? seed_neighbours : neighboursWithin(tree, points[i], eps);
            if (neighbours.size() < options.cluster_min_samples)
                continue; // border point
            for (size_t j : neighbours)
            {
                if (labels[j] == UNASSIGNED)
                {
                    labels[j] = label;
                    queue.push_back(j);
                }
            }
        }
    }

    if (clusters.empty())
    {
        return strategy_result::failure(codes::REASON_NO_CLUSTER);
    }

    // nearest to the slice centre, then the larger, then the earliest
    size_t best = 0;
    double best_distance = INFINITY;
    std::vector<points_2d> cluster_points(clusters.size());
    for (size_t c = 0; c < clusters.size(); c++)
    {
        std::sort(clusters[c].begin(), clusters[c].end());
        for (size_t i : clusters[c])
        {
            cluster_points[c].push_back(points[i]);
        }
        const double distance = (centroidOf(cluster_points[c]) - input.slice_centroid).norm();
        if (c == 0 || distance < best_distance - options.tie_epsilon ||
            (std::abs(distance - best_distance) <= options.tie_epsilon &&
             cluster_points[c].size() > cluster_points[best].size()))
        {
            best = c;
            best_distance = distance;
        }
    }

    if (cluster_points[best].size() < options.min_loop_points)
    {
        return strategy_result::failure(codes::REASON_TOO_FEW_BOUNDARY_POINTS);
    }
    return orderedLoop(LoopMethod::CLUSTER_TRIM, cluster_points[best], input, true);
}

strategy_result convexHullLoop(const loop_input &input)
{
    points_2d hull = convexHull(input.component.points);
    if (hull.empty())
    {
        return strategy_result::failure(codes::REASON_DEGENERATE);
    }

    strategy_result result;
    if (input.single_component_forced)
    {
        result.method = LoopMethod::SINGLE_COMPONENT_FALLBACK;
        result.warnings.emplace_back(codes::TORSO_SINGLE_COMPONENT_FALLBACK_USED);
    }
    else
    {
        result.method = LoopMethod::CONVEX_HULL;
        result.warnings.emplace_back(codes::TORSO_FALLBACK_HULL_USED);
    }
    result.loop.points = std::move(hull);
    result.loop.simple = true;
    result.loop.approximation = true;
    return result;
}

std::vector<named_strategy> defaultStrategyChain()
{
    std::vector<named_strategy> chain;
    chain.push_back({"polar_angle", "PRIMARY", polarAngleLoop, {}});
    chain.push_back({"alpha_shape", "ALPHA", [](const loop_input &in) { return alphaShapeLoop(in, in.alpha_k); }, {}});
    chain.push_back({"alpha_relax", "ALPHA",
                     [](const loop_input &in) { return alphaShapeLoop(in, std::min<size_t>(in.alpha_k, 3)); },
                     [](const loop_input &in, const std::vector<loop_attempt_record> &attempts) {
                         return std::min<size_t>(in.alpha_k, 3) < in.alpha_k && alphaRanOutOfBoundary(attempts);
                     }});
    chain.push_back({"secondary_boundary", "SECONDARY", secondaryBoundaryLoop,
                     [](const loop_input &, const std::vector<loop_attempt_record> &attempts) {
                         return alphaRanOutOfBoundary(attempts);
                     }});
    chain.push_back({"cluster_trim", "CLUSTER_TRIM", clusterTrimLoop, {}});
    chain.push_back({"convex_hull", "HULL", convexHullLoop, {}});
    return chain;
}

} // namespace bodymeasure
