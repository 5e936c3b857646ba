#include <gtest/gtest.h>

#include <bodymeasure/facts/facts_summary.hpp>
#include <bodymeasure/measure/batch.hpp>
#include <bodymeasure/measure/measure.hpp>
#include <bodymeasure/types/warning_codes.hpp>

#include "synthetic_body.hpp"

using namespace bodymeasure;
using namespace bodymeasure::testing_shapes;

namespace
{
std::vector<batch_case> mixedCases()
{
    std::vector<batch_case> cases(3);
    cases[0].case_id = "cylinder";
    cases[0].cloud = cylinder(0.15);

    cases[1].case_id = "two_points";
    cases[1].cloud.emplace_back(0.0, 0.0, 0.0);
    cases[1].cloud.emplace_back(0.0, 1.0, 0.0);

    cases[2].case_id = "not_finite";
    cases[2].cloud = cylinder(0.15, 1.0, 11, 50);
    cases[2].cloud[3].x() = NAN;
    return cases;
}

const std::vector<std::string> mixed_keys{"WAIST", "NECK", "BOGUS"};
} // namespace

TEST(batch, outcomes_are_case_major)
{
    // GIVEN: three cases, one of them not finite, and one unknown key
    const std::vector<batch_case> cases = mixedCases();

    // WHEN: we run them in parallel
    const std::vector<batch_outcome> outcomes = runBatch(cases, mixed_keys, measure_options{}, 2);

    // THEN: every pair has an outcome in case-major order
    ASSERT_EQ(outcomes.size(), 9u);
    for (size_t c = 0; c < cases.size(); c++)
    {
        for (size_t k = 0; k < mixed_keys.size(); k++)
        {
            EXPECT_EQ(outcomes[c * 3 + k].case_id, cases[c].case_id);
            EXPECT_EQ(outcomes[c * 3 + k].key, mixed_keys[k]);
        }
    }

    // AND: contract violations only abort their own pair
    EXPECT_TRUE(outcomes[0].result.has_value());
    EXPECT_TRUE(outcomes[1].result.has_value());
    EXPECT_FALSE(outcomes[2].result.has_value());
    EXPECT_FALSE(outcomes[2].contract_error.empty());
    EXPECT_TRUE(outcomes[3].result.has_value());
    for (size_t i = 6; i < 9; i++)
    {
        EXPECT_FALSE(outcomes[i].result.has_value());
    }
}

TEST(batch, parallelism_does_not_change_results)
{
    // GIVEN: the same cases
    const std::vector<batch_case> cases = mixedCases();

    // WHEN: we run them on one and on four threads
    const std::vector<batch_outcome> serial = runBatch(cases, mixed_keys, measure_options{}, 1);
    const std::vector<batch_outcome> parallel = runBatch(cases, mixed_keys, measure_options{}, 4);

    // THEN: the outcomes are the same
    ASSERT_EQ(serial.size(), parallel.size());
    for (size_t i = 0; i < serial.size(); i++)
    {
        ASSERT_EQ(serial[i].result.has_value(), parallel[i].result.has_value());
        EXPECT_EQ(serial[i].contract_error, parallel[i].contract_error);
        if (!serial[i].result.has_value())
            continue;
        EXPECT_EQ(serial[i].result->section_id, parallel[i].result->section_id);
        EXPECT_EQ(serial[i].result->warnings, parallel[i].result->warnings);
        if (serial[i].result->defined())
            EXPECT_EQ(serial[i].result->value, parallel[i].result->value);
    }
}

TEST(batch, case_id_comes_from_the_batch_entry)
{
    // GIVEN: a single cylinder case and options carrying another case id
    std::vector<batch_case> cases(1);
    cases[0].case_id = "subject_17";
    cases[0].cloud = cylinder(0.15);
    measure_options options;
    options.case_id = "ignored";

    // WHEN: we run the waist in a batch and directly with the entry's case id
    const std::vector<batch_outcome> outcomes = runBatch(cases, {"WAIST"}, options, 1);
    measure_options direct_options = options;
    direct_options.case_id = "subject_17";
    const MeasurementResult direct = measureCircumference(cases[0].cloud, MeasurementKey::WAIST, direct_options);

    // THEN: both agree
    ASSERT_TRUE(outcomes[0].result.has_value());
    EXPECT_EQ(outcomes[0].result->section_id, direct.section_id);
    EXPECT_EQ(outcomes[0].result->method_tag, direct.method_tag);
    EXPECT_EQ(outcomes[0].result->warnings, direct.warnings);
    EXPECT_EQ(outcomes[0].result->facts.loop_attempts, direct.facts.loop_attempts);
}

TEST(facts, summary_counts)
{
    // GIVEN: the outcomes of a mixed batch
    const std::vector<batch_outcome> outcomes = runBatch(mixedCases(), mixed_keys, measure_options{}, 2);

    // WHEN: we summarize them
    const facts_summary summary = summarizeFacts(outcomes);

    // THEN: violations and processed results are counted apart
    EXPECT_EQ(summary.total, 9u);
    EXPECT_EQ(summary.contract_violations, 5u);
    EXPECT_EQ(summary.processed, 4u);

    // AND: each processed result used exactly one method
    size_t methods = 0;
    for (const auto &kv : summary.method_usage)
    {
        methods += kv.second;
    }
    EXPECT_EQ(methods, summary.processed);
    EXPECT_EQ(summary.method_usage.at("none"), 2u);

    // AND: the degenerate case gives one undefined value per key
    ASSERT_EQ(summary.per_key.count("WAIST"), 1u);
    EXPECT_EQ(summary.per_key.at("WAIST").processed, 2u);
    EXPECT_EQ(summary.per_key.at("WAIST").nan_count, 1u);
    EXPECT_DOUBLE_EQ(summary.per_key.at("WAIST").nanRate(), 0.5);
    EXPECT_EQ(summary.per_key.count("BOGUS"), 0u);
    EXPECT_EQ(summary.failure_reasons.at(codes::DEGEN_FAIL), 2u);
    EXPECT_EQ(summary.warning_codes.at(codes::INSUFFICIENT_VERTICES), 2u);
    EXPECT_EQ(summary.warning_families.at(codes::INSUFFICIENT_VERTICES), 2u);
}

TEST(facts, empty_batch)
{
    // GIVEN: nothing
    const facts_summary summary = summarizeFacts({});

    // THEN: all counts are zero
    EXPECT_EQ(summary.total, 0u);
    EXPECT_EQ(summary.processed, 0u);
    EXPECT_TRUE(summary.method_usage.empty());
    EXPECT_TRUE(std::isnan(key_facts{}.nanRate()));
}
