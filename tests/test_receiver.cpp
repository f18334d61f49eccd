#include <gtest/gtest.h>

#include "hashsweep/error.hpp"
#include "hashsweep/receiver.hpp"
#include "test_support.hpp"

#include <sstream>

using namespace hashsweep;

class ReceiverTest : public HashsweepTest {};

TEST_F(ReceiverTest, ParsesFirstColumn) {
    std::istringstream input("alice,1\nbob,2\r\n  carol  ,3\n");
    ReceiverStatistics stats;

    auto candidates = parse_candidates(input, ',', &stats);

    EXPECT_EQ(candidates, (std::vector<Candidate>{"alice", "bob", "carol"}));
    EXPECT_EQ(stats.total_lines, 3u);
    EXPECT_EQ(stats.valid_lines, 3u);
    EXPECT_EQ(stats.invalid_lines, 0u);
}

TEST_F(ReceiverTest, SkipsEmptyRecords) {
    std::istringstream input("alice\n\n   \n,orphan\nbob\n");
    ReceiverStatistics stats;

    auto candidates = parse_candidates(input, ',', &stats);

    EXPECT_EQ(candidates, (std::vector<Candidate>{"alice", "bob"}));
    EXPECT_EQ(stats.total_lines, 5u);
    EXPECT_EQ(stats.invalid_lines, 3u);
}

TEST_F(ReceiverTest, UnquotesQuotedFields) {
    std::istringstream input("\"last, first\",x\n\"say \"\"hi\"\"\"\n");

    auto candidates = parse_candidates(input, ',');

    EXPECT_EQ(candidates, (std::vector<Candidate>{"last, first", "say \"hi\""}));
}

TEST_F(ReceiverTest, QuotedFieldMaySpanLines) {
    std::istringstream input("\"line one\r\nline \"\"two\"\"\",x\nbob\n\"unterminated\n");
    ReceiverStatistics stats;

    auto candidates = parse_candidates(input, ',', &stats);

    EXPECT_EQ(candidates, (std::vector<Candidate>{"line one\nline \"two\"", "bob", "unterminated"}));
    EXPECT_EQ(stats.total_lines, 3u);
    EXPECT_EQ(stats.valid_lines, 3u);
}

TEST_F(ReceiverTest, HonorsCustomDelimiter) {
    std::istringstream input("a;b\nc,d;e\n");

    auto candidates = parse_candidates(input, ';');

    EXPECT_EQ(candidates, (std::vector<Candidate>{"a", "c,d"}));
}

TEST_F(ReceiverTest, ReadsFileInOrder) {
    write_file("input.csv", "alice\nbob\ncarol\n");
    Receiver receiver(path("input.csv"), ',', logger_);

    receiver.validate_file();
    auto candidates = receiver.read_all();

    EXPECT_EQ(candidates, (std::vector<Candidate>{"alice", "bob", "carol"}));
    EXPECT_EQ(receiver.statistics().valid_lines, 3u);
    EXPECT_NE(log_contents().find("Loaded 3 valid records"), std::string::npos);
}

TEST_F(ReceiverTest, MissingFileRaisesIOError) {
    Receiver receiver(path("missing.csv"), ',', logger_);

    EXPECT_THROW(receiver.validate_file(), IOError);
    EXPECT_THROW(receiver.read_all(), IOError);
}

TEST_F(ReceiverTest, DirectoryIsNotAFile) {
    std::filesystem::create_directories(path("dir.csv"));
    Receiver receiver(path("dir.csv"), ',', logger_);

    EXPECT_THROW(receiver.validate_file(), IOError);
}
