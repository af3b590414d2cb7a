#include "gtest/gtest.h"
#include "../src/core/CopyError.hpp"
#include "../src/core/SliceCalculator.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace {

void expect_exact_cover(int64_t file_size, const std::vector<SliceRange>& slices) {
    ASSERT_FALSE(slices.empty());
    int64_t expected_start = 0;
    int64_t sum = 0;
    for (size_t i = 0; i < slices.size(); ++i) {
        EXPECT_EQ(slices[i].index, static_cast<int>(i));
        EXPECT_EQ(slices[i].start, expected_start);
        if (file_size > 0) {
            EXPECT_LT(slices[i].start, slices[i].end);
        }
        expected_start = slices[i].end;
        sum += slices[i].length();
    }
    EXPECT_EQ(expected_start, file_size);
    EXPECT_EQ(sum, file_size);
}

} // namespace

TEST(SliceCalculatorTest, TenBytesThreeSlices)
{
    auto slices = SliceCalculator::plan(10, 3);
    std::vector<SliceRange> expected = {{0, 0, 4}, {1, 4, 7}, {2, 7, 10}};
    EXPECT_EQ(slices, expected);
}

TEST(SliceCalculatorTest, EmptyFileGetsOneEmptySlice)
{
    auto slices = SliceCalculator::plan(0, 1);
    ASSERT_EQ(slices.size(), 1u);
    EXPECT_EQ(slices[0], SliceRange(0, 0, 0));
    EXPECT_TRUE(slices[0].empty());

    auto many = SliceCalculator::plan(0, 8);
    ASSERT_EQ(many.size(), 1u);
    EXPECT_EQ(many[0], SliceRange(0, 0, 0));
}

TEST(SliceCalculatorTest, EvenSplit)
{
    auto slices = SliceCalculator::plan(100, 4);
    ASSERT_EQ(slices.size(), 4u);
    for (const auto& s : slices) {
        EXPECT_EQ(s.length(), 25);
    }
    expect_exact_cover(100, slices);
}

TEST(SliceCalculatorTest, SingleSliceCoversWholeFile)
{
    auto slices = SliceCalculator::plan(12345, 1);
    ASSERT_EQ(slices.size(), 1u);
    EXPECT_EQ(slices[0], SliceRange(0, 0, 12345));
}

TEST(SliceCalculatorTest, MoreSlicesThanBytesIsClamped)
{
    auto slices = SliceCalculator::plan(3, 10);
    ASSERT_EQ(slices.size(), 3u);
    for (const auto& s : slices) {
        EXPECT_EQ(s.length(), 1);
    }
    expect_exact_cover(3, slices);
}

TEST(SliceCalculatorTest, RejectsInvalidInput)
{
    try {
        SliceCalculator::plan(10, 0);
        FAIL() << "expected CopyError";
    } catch (const CopyError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidPlan);
    }
    EXPECT_THROW(SliceCalculator::plan(10, -2), CopyError);
    EXPECT_THROW(SliceCalculator::plan(-1, 3), CopyError);
    EXPECT_THROW(SliceCalculator::plan_by_size(10, 0), CopyError);
    EXPECT_THROW(SliceCalculator::plan_by_size(10, -5), CopyError);
}

TEST(SliceCalculatorTest, CoverageAndSkewHoldAcrossSizes)
{
    const std::vector<int64_t> sizes = {1, 2, 7, 10, 99, 100, 101, 4096, 65537, 1000003};
    for (int64_t size : sizes) {
        for (int count = 1; count <= 17; ++count) {
            SCOPED_TRACE("size=" + std::to_string(size) + " count=" + std::to_string(count));
            auto slices = SliceCalculator::plan(size, count);
            EXPECT_EQ(static_cast<int64_t>(slices.size()), std::min<int64_t>(count, size));
            expect_exact_cover(size, slices);

            auto by_length = [](const SliceRange& a, const SliceRange& b) { return a.length() < b.length(); };
            int64_t longest = std::max_element(slices.begin(), slices.end(), by_length)->length();
            int64_t shortest = std::min_element(slices.begin(), slices.end(), by_length)->length();
            EXPECT_LE(longest - shortest, 1);
        }
    }
}

TEST(SliceCalculatorTest, RemainderGoesToLeadingSlices)
{
    auto slices = SliceCalculator::plan(11, 4);
    ASSERT_EQ(slices.size(), 4u);
    EXPECT_EQ(slices[0].length(), 3);
    EXPECT_EQ(slices[1].length(), 3);
    EXPECT_EQ(slices[2].length(), 3);
    EXPECT_EQ(slices[3].length(), 2);
}

TEST(SliceCalculatorTest, PlanIsIdempotent)
{
    EXPECT_EQ(SliceCalculator::plan(1000003, 7), SliceCalculator::plan(1000003, 7));
    EXPECT_EQ(SliceCalculator::plan_by_size(5000, 333), SliceCalculator::plan_by_size(5000, 333));
}

TEST(SliceCalculatorTest, SliceCountFromTargetSize)
{
    EXPECT_EQ(SliceCalculator::slice_count_for_size(100, 25), 4);
    EXPECT_EQ(SliceCalculator::slice_count_for_size(101, 25), 5);
    EXPECT_EQ(SliceCalculator::slice_count_for_size(10, 1000), 1);
    EXPECT_EQ(SliceCalculator::slice_count_for_size(0, 1000), 1);

    auto slices = SliceCalculator::plan_by_size(101, 25);
    ASSERT_EQ(slices.size(), 5u);
    expect_exact_cover(101, slices);
}

TEST(SliceCalculatorTest, PlanSerializesToJson)
{
    auto slices = SliceCalculator::plan(10, 3);
    json plan = plan_to_json(10, slices);
    EXPECT_EQ(plan["file_size"], 10);
    EXPECT_EQ(plan["slice_count"], 3);
    ASSERT_EQ(plan["slices"].size(), 3u);
    EXPECT_EQ(plan["slices"][1]["start"], 4);
    EXPECT_EQ(plan["slices"][1]["end"], 7);
    EXPECT_EQ(plan["slices"][1]["length"], 3);
}
