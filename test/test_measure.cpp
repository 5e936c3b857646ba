#include <gtest/gtest.h>

#include <bodymeasure/measure/measure.hpp>
#include <bodymeasure/types/warning_codes.hpp>

#include "synthetic_body.hpp"

#include <algorithm>
#include <random>
#include <stdexcept>

using namespace bodymeasure;
using namespace bodymeasure::testing_shapes;

namespace
{
// a single candidate exactly at mid-height
measure_options midHeightOptions(MeasurementKey key)
{
    measure_options options;
    options.num_candidates = 1;
    options.policies[keyIndex(key)] = region_policy{"mid_height", 0.5, 0.5, SelectionStatistic::MEDIAN, false};
    return options;
}

size_t countContaining(const std::vector<std::string> &warnings, const std::string &part)
{
    return std::count_if(warnings.begin(), warnings.end(),
                         [&part](const std::string &w) { return w.find(part) != std::string::npos; });
}

// radius grows linearly with height, rings exactly at the 20 candidate heights of [0.5, 0.8]
point_cloud coneAtCandidates()
{
    point_cloud cloud;
    auto radius = [](double y) { return 0.1 + 0.1 * y; };
    addRing(cloud, 0, 0, 0, radius(0), 100);
    addRing(cloud, 0, 0, 1, radius(1), 100);
    for (size_t i = 0; i < 20; i++)
    {
        const double y = 0.5 + 0.3 * i / 19.0;
        addRing(cloud, 0, 0, y, radius(y), 200);
    }
    return cloud;
}
} // namespace

TEST(measure, cylinder_circumference_at_mid_height)
{
    // GIVEN: a cylinder of radius 0.15 m
    const double r = 0.15;
    point_cloud cloud = cylinder(r);

    // WHEN: we measure at mid-height
    MeasurementResult result = measureCircumference(cloud, MeasurementKey::WAIST, midHeightOptions(MeasurementKey::WAIST));

    // THEN: the circumference is within 1% of 2 pi r, from the primary strategy
    ASSERT_TRUE(result.defined());
    EXPECT_NEAR(result.value, 2 * M_PI * r, 0.01 * 2 * M_PI * r);
    EXPECT_EQ(result.method_tag, "polar_angle");
    EXPECT_FALSE(result.failure_reason.has_value());
    EXPECT_FALSE(result.hasWarningFamily("UNIT_FAIL"));
    EXPECT_EQ(result.facts.axis, "y");
    EXPECT_DOUBLE_EQ(result.facts.plane_value, 0.5);
    EXPECT_EQ(result.facts.slice_point_count, 200u);
    EXPECT_EQ(result.facts.component_count, 1u);
    EXPECT_TRUE(result.facts.loop_simple);
    EXPECT_FALSE(result.facts.loop_approximation);
}

TEST(measure, cylinder_waist_with_default_policy)
{
    // GIVEN: a cylinder, where the waist region never separates from anything
    const double r = 0.15;
    point_cloud cloud = cylinder(r);

    // WHEN: we measure the waist with the default policy
    MeasurementResult result = measureCircumference(cloud, MeasurementKey::WAIST);

    // THEN: the single component forces a fallback, with exactly one reason and one method
    // the fallback boundaries are inscribed in the ring, so they never exceed it
    ASSERT_TRUE(result.defined());
    EXPECT_LE(result.value, ringPerimeter(r, 200) + 1e-9);
    EXPECT_GT(result.value, 0.8 * 2 * M_PI * r);
    EXPECT_TRUE(result.hasWarning(codes::SINGLE_COMPONENT_ONLY));
    EXPECT_NE(result.method_tag, "polar_angle");
    EXPECT_NE(result.method_tag, "none");
    EXPECT_EQ(countContaining(result.warnings, "_FAIL:"), 1u);
    EXPECT_TRUE(result.hasWarning(codes::MIN_SEARCH_USED));

    // AND: every candidate has the same loop, so the minimum is ambiguous and the first one is used
    EXPECT_TRUE(result.hasWarning(codes::REGION_AMBIGUOUS));
    EXPECT_EQ(result.facts.candidate_index, 0);
    EXPECT_EQ(result.facts.valid_candidate_count, 20u);
    ASSERT_FALSE(result.facts.loop_attempts.empty());
    EXPECT_EQ(result.facts.loop_attempts[0].code, "PRIMARY_FAIL:SINGLE_COMPONENT_ONLY");
}

TEST(measure, too_few_vertices_is_degenerate)
{
    // GIVEN: clouds with 0, 1 and 2 points
    for (size_t n = 0; n <= 2; n++)
    {
        point_cloud cloud;
        for (size_t i = 0; i < n; i++)
            cloud.emplace_back(0.0, static_cast<double>(i), 0.0);

        // WHEN: we measure
        MeasurementResult result;
        EXPECT_NO_THROW(result = measureCircumference(cloud, MeasurementKey::HIP));

        // THEN: the value is undefined with a reason
        EXPECT_TRUE(std::isnan(result.value));
        ASSERT_TRUE(result.failure_reason.has_value());
        EXPECT_EQ(*result.failure_reason, codes::DEGEN_FAIL);
        EXPECT_TRUE(result.hasWarning(codes::INSUFFICIENT_VERTICES));
        EXPECT_EQ(result.method_tag, "none");
        EXPECT_FALSE(result.section_id.empty());
    }
}

TEST(measure, zero_extent_is_degenerate)
{
    // GIVEN: 100 copies of the same vertex
    point_cloud cloud(100, Eigen::Vector3d(0.1, 0.9, 0.2));

    // WHEN: we measure
    MeasurementResult result = measureCircumference(cloud, MeasurementKey::NECK);

    // THEN: the value is undefined, no exception
    EXPECT_TRUE(std::isnan(result.value));
    ASSERT_TRUE(result.failure_reason.has_value());
    EXPECT_EQ(*result.failure_reason, codes::DEGEN_FAIL);
    EXPECT_TRUE(result.hasWarning(codes::BODY_AXIS_TOO_SHORT));
}

TEST(measure, empty_region_lists_candidate_failures)
{
    // GIVEN: a body with vertices only at its two ends
    point_cloud cloud;
    addRing(cloud, 0, 0, 0, 0.15, 100);
    addRing(cloud, 0, 0, 1, 0.15, 100);

    // WHEN: we measure the thigh, whose region is empty
    MeasurementResult result = measureCircumference(cloud, MeasurementKey::THIGH);

    // THEN: it is undefined and every candidate failure is counted
    EXPECT_TRUE(std::isnan(result.value));
    EXPECT_EQ(*result.failure_reason, codes::DEGEN_FAIL);
    EXPECT_TRUE(result.hasWarning(codes::EMPTY_CANDIDATES));
    EXPECT_TRUE(result.hasWarning("CANDIDATE_FAIL:TOO_FEW_SLICE_POINTS:20"));
    EXPECT_EQ(result.facts.valid_candidate_count, 0u);
}

TEST(measure, skipped_candidates_are_counted)
{
    // GIVEN: a cylinder up to 0.55 m and a single vertex at 1 m
    point_cloud cloud;
    for (size_t i = 0; i <= 55; i++)
        addRing(cloud, 0, 0, i / 100.0, 0.15, 200);
    cloud.emplace_back(0.0, 1.0, 0.0);

    // WHEN: we measure over 0.4 to 0.7 of the height
    MeasurementResult result = measureCircumference(cloud, MeasurementKey::WAIST);

    // THEN: a value is found and the empty upper candidates are reported
    ASSERT_TRUE(result.defined());
    EXPECT_TRUE(result.hasWarningFamily(codes::CANDIDATES_SKIPPED));
    EXPECT_LT(result.facts.valid_candidate_count, result.facts.candidate_count);
    EXPECT_GT(result.facts.valid_candidate_count, 0u);
}

TEST(measure, scaled_input_is_flagged_not_rescaled)
{
    // GIVEN: the same cylinder in meters and scaled by 100
    point_cloud meters = cylinder(0.15);
    point_cloud scaled = cylinder(0.15, 1.0, 101, 200, 100.0);
    const measure_options options = midHeightOptions(MeasurementKey::CHEST);

    // WHEN: we measure both
    MeasurementResult a = measureCircumference(meters, MeasurementKey::CHEST, options);
    MeasurementResult b = measureCircumference(scaled, MeasurementKey::CHEST, options);

    // THEN: only the scaled one has a unit warning, and its value is 100 times larger
    EXPECT_FALSE(a.hasWarningFamily("UNIT_FAIL"));
    EXPECT_TRUE(b.hasWarningFamily("UNIT_FAIL"));
    EXPECT_TRUE(b.hasWarning(codes::UNIT_FAIL_SCALE_LARGE));
    EXPECT_TRUE(b.hasWarning(codes::PERIMETER_LARGE));
    ASSERT_TRUE(a.defined());
    ASSERT_TRUE(b.defined());
    EXPECT_NEAR(b.value / a.value, 100, 1e-6);
}

TEST(measure, torso_is_separated_from_arms)
{
    // GIVEN: a torso with arms alongside it
    point_cloud cloud = torsoWithArms();

    // WHEN: we measure the bust
    MeasurementResult result = measureCircumference(cloud, MeasurementKey::BUST);

    // THEN: the torso ring is measured with the primary strategy
    ASSERT_TRUE(result.defined());
    EXPECT_NEAR(result.value, ringPerimeter(0.15, 200), 1e-9);
    EXPECT_NEAR(result.value, 2 * M_PI * 0.15, 0.01 * 2 * M_PI * 0.15);
    EXPECT_EQ(result.method_tag, "polar_angle");
    EXPECT_EQ(result.facts.component_count, 3u);
    EXPECT_EQ(result.facts.tiebreak, "distance");
    EXPECT_FALSE(result.hasWarning(codes::TORSO_TIEBREAK_USED));
    EXPECT_FALSE(result.hasWarning(codes::SINGLE_COMPONENT_ONLY));
    EXPECT_NE(result.section_id.find("\"key\":\"BUST\""), std::string::npos) << result.section_id;
    EXPECT_NE(result.section_id.find("\"tiebreak\":\"distance\""), std::string::npos) << result.section_id;
}

TEST(measure, shuffled_vertices_give_identical_results)
{
    // GIVEN: a body and the same vertices in a different order
    point_cloud cloud = torsoWithArms();
    point_cloud shuffled = cloud;
    std::mt19937 gen(42);
    std::shuffle(shuffled.begin(), shuffled.end(), gen);

    for (MeasurementKey key : allMeasurementKeys())
    {
        // WHEN: we measure both
        MeasurementResult a = measureCircumference(cloud, key);
        MeasurementResult b = measureCircumference(shuffled, key);

        // THEN: the results are identical
        if (a.defined())
            EXPECT_EQ(a.value, b.value) << toString(key);
        else
            EXPECT_TRUE(std::isnan(b.value)) << toString(key);
        EXPECT_EQ(a.section_id, b.section_id) << toString(key);
        EXPECT_EQ(a.method_tag, b.method_tag) << toString(key);
        EXPECT_EQ(a.warnings, b.warnings) << toString(key);
    }
}

TEST(measure, repeated_calls_are_identical)
{
    // GIVEN: a body and a case id
    point_cloud cloud = torsoWithArms();
    measure_options options;
    options.case_id = "case_0042";

    for (MeasurementKey key : allMeasurementKeys())
    {
        // WHEN: we measure twice
        MeasurementResult a = measureCircumference(cloud, key, options);
        MeasurementResult b = measureCircumference(cloud, key, options);

        // THEN: nothing differs
        EXPECT_TRUE(a.value == b.value || (std::isnan(a.value) && std::isnan(b.value))) << toString(key);
        EXPECT_EQ(a.section_id, b.section_id);
        EXPECT_EQ(a.method_tag, b.method_tag);
        EXPECT_EQ(a.warnings, b.warnings);
        EXPECT_EQ(a.facts.loop_attempts, b.facts.loop_attempts);
    }
}

TEST(measure, noisy_torso_is_not_measured_by_a_fragment)
{
    // GIVEN: an elliptic torso of semi-axes 0.16 and 0.11 m with 2 mm of scanner noise
    const double a = 0.16, b = 0.11;
    const double true_perimeter = M_PI * (3 * (a + b) - std::sqrt((3 * a + b) * (a + 3 * b)));
    point_cloud cloud;
    std::mt19937 gen(7);
    std::normal_distribution<double> noise(0, 0.002);
    for (size_t i = 0; i <= 100; i++)
    {
        for (size_t j = 0; j < 300; j++)
        {
            const double theta = 2 * M_PI * j / 300;
            cloud.emplace_back(a * std::cos(theta) + noise(gen), i / 100.0, b * std::sin(theta) + noise(gen));
        }
    }

    for (const std::string case_id : {"", "abc", "case_7"})
    {
        // WHEN: we measure the waist, where no limbs separate from the torso
        measure_options options;
        options.case_id = case_id;
        MeasurementResult result = measureCircumference(cloud, MeasurementKey::WAIST, options);

        // THEN: the value goes all the way around the body, whatever strategy produced it
        ASSERT_TRUE(result.defined()) << case_id;
        EXPECT_GT(result.value, 0.7 * true_perimeter) << case_id << " " << result.method_tag;
    }
}

TEST(measure, statistic_picks_the_candidate)
{
    // GIVEN: a cone with one ring per candidate height, widening upwards
    point_cloud cloud = coneAtCandidates();
    measure_options options;
    options.slice_tolerance = 0.001;
    auto measureWith = [&](SelectionStatistic statistic) {
        options.policies[keyIndex(MeasurementKey::HIP)] = region_policy{"cone", 0.5, 0.8, statistic, false};
        return measureCircumference(cloud, MeasurementKey::HIP, options);
    };

    // WHEN: we measure with each statistic
    MeasurementResult max = measureWith(SelectionStatistic::MAX);
    MeasurementResult min = measureWith(SelectionStatistic::MIN);
    MeasurementResult median = measureWith(SelectionStatistic::MEDIAN);

    // THEN: max takes the top, min the bottom and median the lower middle candidate
    EXPECT_EQ(max.facts.candidate_index, 19);
    EXPECT_EQ(min.facts.candidate_index, 0);
    EXPECT_EQ(median.facts.candidate_index, 9);
    EXPECT_NEAR(max.value, 2 * M_PI * 0.18, 0.01);
    EXPECT_NEAR(min.value, 2 * M_PI * 0.15, 0.01);
    EXPECT_TRUE(min.hasWarning(codes::MIN_SEARCH_USED));
    EXPECT_FALSE(max.hasWarning(codes::MIN_SEARCH_USED));
    EXPECT_FALSE(median.hasWarning(codes::REGION_AMBIGUOUS));
}

TEST(measure, contract_violations_throw)
{
    // GIVEN: a valid body
    point_cloud cloud = cylinder(0.15);

    // THEN: unknown keys, non-finite vertices and unusable options throw
    EXPECT_THROW(measureCircumference(cloud, "ARMPIT"), std::invalid_argument);
    EXPECT_THROW(measureCircumference(cloud, static_cast<MeasurementKey>(99)), std::invalid_argument);

    point_cloud broken = cloud;
    broken[10].y() = NAN;
    EXPECT_THROW(measureCircumference(broken, MeasurementKey::WAIST), std::invalid_argument);

    measure_options options;
    options.num_candidates = 0;
    EXPECT_THROW(measureCircumference(cloud, MeasurementKey::WAIST, options), std::invalid_argument);

    // AND: the standard key form is accepted
    EXPECT_NO_THROW(measureCircumference(cloud, "NECK_CIRC_M"));
}
