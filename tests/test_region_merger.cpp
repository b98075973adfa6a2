/**
 * @file test_region_merger.cpp
 * @brief IoU helper and greedy IoU deduplication
 */

#include "roix/errors.hpp"
#include "roix/geometry.hpp"
#include "roix/region_merger.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace roix;

namespace
{
    std::vector<cv::Rect> boxes_of(const std::vector<Region> &regions)
    {
        std::vector<cv::Rect> out;
        for (const auto &r : regions)
            out.push_back(r.bbox());
        return out;
    }
}

// ============================================================================
// IoU
// ============================================================================

TEST(IouTest, SymmetricAndBounded)
{
    const std::vector<cv::Rect> rects = {{0, 0, 10, 10}, {5, 5, 10, 10}, {2, 8, 30, 4}, {100, 100, 3, 3}};
    for (const auto &a : rects)
        for (const auto &b : rects)
        {
            const double v = iou(a, b);
            EXPECT_DOUBLE_EQ(v, iou(b, a));
            EXPECT_GE(v, 0.0);
            EXPECT_LE(v, 1.0);
        }
}

TEST(IouTest, IdentityAndDisjoint)
{
    EXPECT_DOUBLE_EQ(iou(cv::Rect(3, 4, 7, 9), cv::Rect(3, 4, 7, 9)), 1.0);
    EXPECT_DOUBLE_EQ(iou(cv::Rect(0, 0, 10, 10), cv::Rect(10, 0, 10, 10)), 0.0);
    EXPECT_DOUBLE_EQ(iou(cv::Rect(0, 0, 10, 10), cv::Rect(50, 50, 1, 1)), 0.0);
}

TEST(IouTest, HalfOverlap)
{
    // intersection 50, union 150
    EXPECT_NEAR(iou(cv::Rect(0, 0, 10, 10), cv::Rect(5, 0, 10, 10)), 1.0 / 3.0, 1e-12);
}

// ============================================================================
// RegionMerger
// ============================================================================

TEST(RegionMergerTest, KeepsLargerOfOverlappingPair)
{
    std::vector<Region> in;
    in.emplace_back(2, 2, 10, 10, "small");
    in.emplace_back(0, 0, 12, 12, "big");
    in.emplace_back(100, 100, 5, 5, "far");

    auto out = RegionMerger::merge(in);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].name(), "big");
    EXPECT_EQ(out[1].name(), "far");
}

TEST(RegionMergerTest, ThresholdIsStrict)
{
    std::vector<Region> in;
    in.emplace_back(0, 0, 10, 10, "a");
    in.emplace_back(5, 0, 10, 10, "b"); // IoU = 1/3

    EXPECT_EQ(RegionMerger::merge(in, 0.3).size(), 1u);
    EXPECT_EQ(RegionMerger::merge(in, 0.34).size(), 2u);
}

TEST(RegionMergerTest, EqualAreasKeepInputOrder)
{
    std::vector<Region> in;
    in.emplace_back(0, 0, 10, 10, "first");
    in.emplace_back(1, 1, 10, 10, "second");
    auto out = RegionMerger::merge(in);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].name(), "first");
}

TEST(RegionMergerTest, Idempotent)
{
    std::vector<Region> in;
    const std::vector<cv::Rect> rects = {{0, 0, 20, 20}, {3, 3, 18, 18}, {15, 15, 20, 20},
                                         {40, 0, 10, 10}, {42, 2, 9, 9}, {0, 40, 30, 5}};
    for (const auto &r : rects)
        in.emplace_back(r);

    auto once = RegionMerger::merge(in, 0.3);
    auto twice = RegionMerger::merge(once, 0.3);
    EXPECT_EQ(boxes_of(once), boxes_of(twice));

    for (std::size_t i = 0; i < once.size(); ++i)
        for (std::size_t j = i + 1; j < once.size(); ++j)
            EXPECT_LE(iou(once[i].bbox(), once[j].bbox()), 0.3);
}

TEST(RegionMergerTest, EmptyInputAndBadThreshold)
{
    EXPECT_TRUE(RegionMerger::merge({}).empty());
    EXPECT_THROW(RegionMerger::merge({}, 1.5), InputError);
    EXPECT_THROW(RegionMerger::merge({}, -0.1), InputError);
}
