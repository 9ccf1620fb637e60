#include <gtest/gtest.h>

#include "malformed_record.hpp"
#include "refine_csv_reader.hpp"
#include "refine_stats.hpp"
#include "test_utils.hpp"

using test_utils::REPORT_HEADER;

class RefineCsvReader : public test_utils::TempDirTest {};

TEST_F(RefineCsvReader, reads_rows_in_header_order)
{
    auto path = write_file("s1.flnc.report.csv",
        std::string(REPORT_HEADER) + "\n"
        "m64012/1/ccs,+,33,31,24,1823,0--1\n"
        "m64012/2/ccs,-,30.5,28,0,2410,0--1\n");

    refine_csv_reader reader(path);
    refine_entry entry;

    ASSERT_TRUE(reader.read_next(entry));
    EXPECT_EQ(entry.id, "m64012/1/ccs");
    EXPECT_EQ(entry.strand, "+");
    EXPECT_DOUBLE_EQ(entry.fivelen, 33);
    EXPECT_DOUBLE_EQ(entry.threelen, 31);
    EXPECT_DOUBLE_EQ(entry.polya_len, 24);
    EXPECT_DOUBLE_EQ(entry.insert_len, 1823);
    EXPECT_EQ(entry.primer, "0--1");
    EXPECT_EQ(reader.get_current_line(), 2u);

    ASSERT_TRUE(reader.read_next(entry));
    EXPECT_DOUBLE_EQ(entry.fivelen, 30.5);
    EXPECT_EQ(entry.strand, "-");

    EXPECT_FALSE(reader.read_next(entry));
    EXPECT_FALSE(reader.has_next());
}

TEST_F(RefineCsvReader, column_order_and_extra_columns)
{
    auto path = write_file("reordered.csv",
        "primer,insertlen,polyAlen,threelen,fivelen,strand,extra\r\n"
        "p7,100,2,3,4,+,ignored\r\n");

    refine_csv_reader reader(path);
    refine_entry entry;
    ASSERT_TRUE(reader.read_next(entry));
    EXPECT_EQ(entry.primer, "p7");
    EXPECT_DOUBLE_EQ(entry.insert_len, 100);
    EXPECT_DOUBLE_EQ(entry.polya_len, 2);
    EXPECT_DOUBLE_EQ(entry.threelen, 3);
    EXPECT_DOUBLE_EQ(entry.fivelen, 4);
    EXPECT_EQ(entry.strand, "+");
    EXPECT_TRUE(entry.id.empty());
}

TEST_F(RefineCsvReader, byte_order_mark_before_header)
{
    auto path = write_file("bom.csv",
        "\xEF\xBB\xBF" + std::string(REPORT_HEADER) + "\n"
        "m64012/1/ccs,+,33,31,24,1823,0--1\n");

    refine_csv_reader reader(path);
    refine_entry entry;
    ASSERT_TRUE(reader.read_next(entry));
    EXPECT_EQ(entry.id, "m64012/1/ccs");
    EXPECT_DOUBLE_EQ(entry.insert_len, 1823);
}

TEST_F(RefineCsvReader, reads_gzipped_report)
{
    auto path = write_gz("s1.flnc.report.csv.gz",
        std::string(REPORT_HEADER) + "\n"
        "a,+,10,5,20,500,p1\n"
        "b,-,12,7,22,520,p1\n");

    auto agg = aggregator::fold_file(path);
    ASSERT_TRUE(agg.has_value());
    EXPECT_DOUBLE_EQ((*agg)[refine_field::FIVELEN].mean, 11);
    EXPECT_EQ(agg->records, 2u);
}

TEST_F(RefineCsvReader, header_only_and_empty_file_have_no_rows)
{
    auto header_only = write_file("header.csv", std::string(REPORT_HEADER) + "\n\n");
    EXPECT_FALSE(aggregator::fold_file(header_only).has_value());

    auto empty = write_file("empty.csv", "");
    EXPECT_FALSE(aggregator::fold_file(empty).has_value());
}

TEST_F(RefineCsvReader, missing_column_is_malformed)
{
    auto path = write_file("bad.csv", "id,strand,fivelen,threelen,insertlen,primer\n");
    try {
        refine_csv_reader reader(path);
        FAIL() << "expected malformed_record";
    } catch (const malformed_record& e) {
        EXPECT_NE(std::string(e.what()).find("polyAlen"), std::string::npos);
        EXPECT_EQ(e.line(), 1u);
        EXPECT_EQ(e.file().string(), path.string());
    }
}

TEST_F(RefineCsvReader, unparseable_number_is_malformed)
{
    auto path = write_file("bad.csv",
        std::string(REPORT_HEADER) + "\n"
        "a,+,10,5,20,500,p1\n"
        "b,+,ten,5,20,500,p1\n");

    refine_csv_reader reader(path);
    refine_entry entry;
    ASSERT_TRUE(reader.read_next(entry));
    try {
        reader.read_next(entry);
        FAIL() << "expected malformed_record";
    } catch (const malformed_record& e) {
        EXPECT_EQ(e.line(), 3u);
        EXPECT_NE(std::string(e.what()).find("fivelen"), std::string::npos);
    }
}

TEST_F(RefineCsvReader, non_finite_number_is_malformed)
{
    for (const char* value : {"nan", "inf", "-inf", "1e999", "", "12abc"}) {
        auto path = write_file("nonfinite.csv",
            std::string(REPORT_HEADER) + "\n"
            "a,+,10,5," + value + ",500,p1\n");
        EXPECT_THROW(aggregator::fold_file(path), malformed_record) << value;
    }
}

TEST_F(RefineCsvReader, empty_label_and_short_row_are_malformed)
{
    auto empty_strand = write_file("strand.csv",
        std::string(REPORT_HEADER) + "\n" "a,,10,5,20,500,p1\n");
    EXPECT_THROW(aggregator::fold_file(empty_strand), malformed_record);

    auto empty_primer = write_file("primer.csv",
        std::string(REPORT_HEADER) + "\n" "a,+,10,5,20,500, \n");
    EXPECT_THROW(aggregator::fold_file(empty_primer), malformed_record);

    auto short_row = write_file("short.csv",
        std::string(REPORT_HEADER) + "\n" "a,+,10,5,20\n");
    EXPECT_THROW(aggregator::fold_file(short_row), malformed_record);
}

TEST(RefineCsvSplit, quoted_fields)
{
    auto fields = refine_csv_reader::split_csv("a,\"b,c\",\"say \"\"hi\"\"\",,");
    ASSERT_EQ(fields.size(), 5u);
    EXPECT_EQ(fields[0], "a");
    EXPECT_EQ(fields[1], "b,c");
    EXPECT_EQ(fields[2], "say \"hi\"");
    EXPECT_EQ(fields[3], "");
    EXPECT_EQ(fields[4], "");
}

TEST(RefineCsvSplit, parse_number)
{
    EXPECT_EQ(refine_csv_reader::parse_number(" 42 "), 42.0);
    EXPECT_EQ(refine_csv_reader::parse_number("1.5e2"), 150.0);
    EXPECT_FALSE(refine_csv_reader::parse_number("NaN").has_value());
    EXPECT_FALSE(refine_csv_reader::parse_number("").has_value());
}
