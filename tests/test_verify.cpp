#include "test_util.hpp"
#include "sequential/sort_error.hpp"

class VerifyTest : public ScratchDirTest {};

TEST_F(VerifyTest, EmptyFileIsSorted) {
    VerificationReport report = validateOutput(writeText("out.txt", ""));
    EXPECT_TRUE(report.is_sorted);
    EXPECT_EQ(report.lines_checked, 0u);
    EXPECT_FALSE(report.first_violation_line.has_value());
}

TEST_F(VerifyTest, SingleLineIsSorted) {
    VerificationReport report = validateOutput(writeLines("out.txt", {"only"}));
    EXPECT_TRUE(report.is_sorted);
    EXPECT_EQ(report.lines_checked, 1u);
}

TEST_F(VerifyTest, EqualNeighboursAreAllowed) {
    VerificationReport report = validateOutput(writeLines("out.txt", {"a", "a", "b", "b"}));
    EXPECT_TRUE(report.is_sorted);
    EXPECT_EQ(report.lines_checked, 4u);
}

TEST_F(VerifyTest, StopsAtFirstViolation) {
    VerificationReport report = validateOutput(writeLines("out.txt", {"a", "b", "d", "c", "a"}));
    EXPECT_FALSE(report.is_sorted);
    ASSERT_TRUE(report.first_violation_line.has_value());
    EXPECT_EQ(*report.first_violation_line, 4u);
    EXPECT_EQ(report.lines_checked, 4u);
}

TEST_F(VerifyTest, UsesByteOrder) {
    EXPECT_TRUE(validateOutput(writeLines("ok.txt", {"B", "Z", "a", "z", "\xc3\xa9"})).is_sorted);
    EXPECT_FALSE(validateOutput(writeLines("bad.txt", {"a", "B"})).is_sorted);
}

TEST_F(VerifyTest, MaxLinesLimitsTheScan) {
    std::string file = writeLines("out.txt", {"a", "c", "b"});
    VerificationReport report = validateOutput(file, 2);
    EXPECT_TRUE(report.is_sorted);
    EXPECT_EQ(report.lines_checked, 2u);
    EXPECT_FALSE(validateOutput(file).is_sorted);
}

TEST_F(VerifyTest, MissingFileThrows) {
    EXPECT_THROW(validateOutput(path("missing.txt")), InputNotFound);
}
