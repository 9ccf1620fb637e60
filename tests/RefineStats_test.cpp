#include <gtest/gtest.h>

#include <cmath>
#include <numeric>
#include <random>

#include "refine_stats.hpp"
#include "test_utils.hpp"

using test_utils::vector_reader;

namespace {
std::vector<refine_entry> random_entries(size_t n, unsigned seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> five(0, 60);
    std::uniform_real_distribution<double> three(0, 45);
    std::uniform_int_distribution<int> polya(0, 80);
    std::normal_distribution<double> insert(2500, 600);
    const char* strands[] = {"+", "-"};
    const char* primers[] = {"0--1", "0--2", "1--3"};

    std::vector<refine_entry> entries;
    for (size_t i = 0; i < n; ++i) {
        entries.emplace_back(five(rng), three(rng), polya(rng), std::fabs(insert(rng)),
            strands[rng() % 2], primers[rng() % 3]);
    }
    return entries;
}

// buffer-then-compute reference
field_summary two_pass(const std::vector<refine_entry>& entries, refine_field field) {
    std::vector<double> values;
    for (const auto& e : entries) values.push_back(e.value(field));
    double mean = std::accumulate(values.begin(), values.end(), 0.0) / values.size();
    double ss = 0;
    for (double v : values) ss += (v - mean) * (v - mean);

    field_summary fs;
    fs.min = *std::min_element(values.begin(), values.end());
    fs.max = *std::max_element(values.begin(), values.end());
    fs.mean = mean;
    fs.stddev = std::sqrt(ss / values.size());
    return fs;
}

void expect_relative(double expected, double actual, double tolerance = 1e-9) {
    EXPECT_NEAR(expected, actual, tolerance * std::max(1.0, std::fabs(expected)));
}
} // anonymous namespace

TEST(RefineStats, scenario_two_reads)
{
    vector_reader reader({
        refine_entry(10, 5, 20, 500, "+", "p1"),
        refine_entry(12, 7, 22, 520, "-", "p1"),
    });
    auto agg = aggregator::fold(reader);
    ASSERT_TRUE(agg.has_value());

    const auto& five = (*agg)[refine_field::FIVELEN];
    EXPECT_DOUBLE_EQ(five.min, 10);
    EXPECT_DOUBLE_EQ(five.mean, 11);
    EXPECT_DOUBLE_EQ(five.stddev, 1.0);
    EXPECT_DOUBLE_EQ(five.max, 12);

    const auto& three = (*agg)[refine_field::THREELEN];
    EXPECT_DOUBLE_EQ(three.min, 5);
    EXPECT_DOUBLE_EQ(three.mean, 6);
    EXPECT_DOUBLE_EQ(three.stddev, 1.0);
    EXPECT_DOUBLE_EQ(three.max, 7);

    const auto& polya = (*agg)[refine_field::POLYALEN];
    EXPECT_DOUBLE_EQ(polya.mean, 21);
    EXPECT_DOUBLE_EQ(polya.stddev, 1.0);

    const auto& insert = (*agg)[refine_field::INSERTLEN];
    EXPECT_DOUBLE_EQ(insert.min, 500);
    EXPECT_DOUBLE_EQ(insert.mean, 510);
    EXPECT_DOUBLE_EQ(insert.stddev, 10.0);
    EXPECT_DOUBLE_EQ(insert.max, 520);

    EXPECT_EQ(agg->strand_counts, (label_counts{{"+", 1}, {"-", 1}}));
    EXPECT_EQ(agg->primer_counts, (label_counts{{"p1", 2}}));
    EXPECT_EQ(agg->records, 2u);
}

TEST(RefineStats, matches_two_pass_reference)
{
    for (unsigned seed : {1u, 7u, 42u}) {
        auto entries = random_entries(5000, seed);
        vector_reader reader(entries);
        auto agg = aggregator::fold(reader);
        ASSERT_TRUE(agg.has_value());

        for (refine_field field : REFINE_FIELDS) {
            auto expected = two_pass(entries, field);
            const auto& actual = (*agg)[field];
            expect_relative(expected.min, actual.min);
            expect_relative(expected.max, actual.max);
            expect_relative(expected.mean, actual.mean);
            expect_relative(expected.stddev, actual.stddev, 1e-7);
        }
    }
}

TEST(RefineStats, empty_stream_is_absent)
{
    vector_reader reader({});
    EXPECT_FALSE(aggregator::fold(reader).has_value());

    running_aggregate running;
    EXPECT_TRUE(running.empty());
    EXPECT_FALSE(running.finalize().has_value());
}

TEST(RefineStats, identity_values_before_folding)
{
    running_aggregate running;
    for (refine_field field : REFINE_FIELDS) {
        const auto& acc = running.accumulator(field);
        EXPECT_EQ(acc.count, 0u);
        EXPECT_EQ(acc.sum, 0);
        EXPECT_TRUE(std::isinf(acc.min) && acc.min > 0);
        EXPECT_TRUE(std::isinf(acc.max) && acc.max < 0);
    }
}

TEST(RefineStats, std_never_negative_or_nan)
{
    // identical values: sum_sq/n - mean^2 may come out slightly negative
    std::vector<refine_entry> entries;
    for (int i = 0; i < 1000; ++i) {
        entries.emplace_back(0.1, 1e8 + 0.3, 33.3, 123456.789, "+", "0--1");
    }
    vector_reader reader(entries);
    auto agg = aggregator::fold(reader);
    ASSERT_TRUE(agg.has_value());

    for (refine_field field : REFINE_FIELDS) {
        double sd = (*agg)[field].stddev;
        EXPECT_FALSE(std::isnan(sd));
        EXPECT_GE(sd, 0.0);
    }

    vector_reader single({refine_entry(3, 4, 5, 6, "-", "x")});
    auto one = aggregator::fold(single);
    ASSERT_TRUE(one.has_value());
    EXPECT_EQ((*one)[refine_field::FIVELEN].stddev, 0.0);
}

TEST(RefineStats, categorical_counts_sum_to_records)
{
    auto entries = random_entries(777, 3);
    vector_reader reader(entries);
    auto agg = aggregator::fold(reader);
    ASSERT_TRUE(agg.has_value());

    uint64_t strands = 0;
    for (const auto& [label, count] : agg->strand_counts) strands += count;
    uint64_t primers = 0;
    for (const auto& [label, count] : agg->primer_counts) primers += count;

    EXPECT_EQ(strands, entries.size());
    EXPECT_EQ(primers, entries.size());
    EXPECT_EQ(agg->records, entries.size());
}

TEST(RefineStats, merged_partitions_equal_single_fold)
{
    auto entries = random_entries(1000, 11);

    running_aggregate whole;
    running_aggregate left;
    running_aggregate right;
    for (size_t i = 0; i < entries.size(); ++i) {
        whole.add(entries[i]);
        (i < 400 ? left : right).add(entries[i]);
    }
    left.merge(right);

    auto expected = whole.finalize();
    auto actual = left.finalize();
    ASSERT_TRUE(expected && actual);
    for (refine_field field : REFINE_FIELDS) {
        expect_relative((*expected)[field].mean, (*actual)[field].mean);
        expect_relative((*expected)[field].stddev, (*actual)[field].stddev, 1e-7);
        EXPECT_EQ((*expected)[field].min, (*actual)[field].min);
        EXPECT_EQ((*expected)[field].max, (*actual)[field].max);
    }
    EXPECT_EQ(expected->strand_counts, actual->strand_counts);
    EXPECT_EQ(expected->primer_counts, actual->primer_counts);
}

TEST(RefineStats, json_uses_report_key_names)
{
    vector_reader reader({refine_entry(10, 5, 20, 500, "+", "p1")});
    auto agg = aggregator::fold(reader);
    ASSERT_TRUE(agg.has_value());

    auto j = agg->to_json();
    EXPECT_EQ(j.size(), 18u);
    for (const char* key : {"min_fivelen", "mean_threelen", "std_polyAlen", "max_insertlen",
                            "strand_counts", "primer_counts"}) {
        EXPECT_TRUE(j.contains(key)) << key;
    }
    EXPECT_EQ(j["primer_counts"]["p1"], 1);
    EXPECT_EQ(j.begin().key(), "min_fivelen");
}

TEST(RefineEntry, value_addresses_each_field)
{
    refine_entry entry;
    double v = 1;
    for (refine_field field : REFINE_FIELDS) {
        entry.value(field) = v++;
    }
    EXPECT_DOUBLE_EQ(entry.fivelen, 1);
    EXPECT_DOUBLE_EQ(entry.threelen, 2);
    EXPECT_DOUBLE_EQ(entry.polya_len, 3);
    EXPECT_DOUBLE_EQ(entry.insert_len, 4);

    const refine_entry& view = entry;
    EXPECT_DOUBLE_EQ(view.value(refine_field::INSERTLEN), 4);
}
