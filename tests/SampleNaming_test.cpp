#include <gtest/gtest.h>

#include "sample_naming.hpp"

TEST(SampleNaming, strips_refine_suffixes)
{
    EXPECT_EQ(sample_naming::clean("/data/run1/movie1.flnc.filter_summary.report.json"), "movie1");
    EXPECT_EQ(sample_naming::clean("movie1.flnc.report.csv"), "movie1");
    EXPECT_EQ(sample_naming::clean("movie1.flnc.report.csv.gz"), "movie1");
    EXPECT_EQ(sample_naming::clean("movie1.filter_summary.json"), "movie1");
    EXPECT_EQ(sample_naming::clean("plain_name"), "plain_name");
}

TEST(SampleNaming, never_strips_to_empty)
{
    EXPECT_EQ(sample_naming::clean(".json"), ".json");
    EXPECT_EQ(sample_naming::clean("report.csv"), "report");
}

TEST(SampleNaming, extra_extensions)
{
    EXPECT_EQ(sample_naming::clean("S1_rep1.refined.report.csv", {".refined"}), "S1_rep1");
    EXPECT_EQ(sample_naming::clean("S1_rep1.refined.report.csv"), "S1_rep1.refined");
}

TEST(SampleNaming, json_and_csv_pair_up)
{
    sample_naming naming;
    EXPECT_EQ(naming.derive("a/s1.flnc.filter_summary.report.json"),
              naming.derive("b/s1.flnc.report.csv"));
    EXPECT_EQ(naming.policy(), naming_policy::CLEANED);
}

TEST(SampleNaming, raw_filename_keeps_everything)
{
    sample_naming naming(naming_policy::RAW_FILENAME);
    EXPECT_EQ(naming.derive("/x/s1.flnc.report.csv"), "s1.flnc.report.csv");
    EXPECT_NE(naming.derive("s1.flnc.filter_summary.report.json"),
              naming.derive("s1.flnc.report.csv"));
}
