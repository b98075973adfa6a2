/**
 * @file test_interactive_cut.cpp
 * @brief Point-seeded GrabCut segmentation
 */

#include "roix/crop.hpp"
#include "roix/errors.hpp"
#include "roix/geometry.hpp"
#include "roix/interactive_cut.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgproc.hpp>
#include <climits>

using namespace roix;

class InteractiveCutTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        img = cv::Mat(200, 200, CV_8UC3, cv::Scalar(235, 235, 235));
        cv::rectangle(img, kSquare, cv::Scalar(30, 30, 30), cv::FILLED);

        // light noise keeps the colour models well conditioned
        cv::Mat noise(img.size(), CV_16SC3);
        cv::RNG rng(1234);
        rng.fill(noise, cv::RNG::NORMAL, 0, 3);
        cv::Mat tmp;
        img.convertTo(tmp, CV_16SC3);
        tmp += noise;
        tmp.convertTo(img, CV_8UC3);
    }

    const cv::Rect kSquare{70, 70, 60, 60};
    cv::Mat img;
    InteractiveCutSegmenter cut;
};

TEST_F(InteractiveCutTest, HintRectIsClipped)
{
    EXPECT_EQ(cut_hint_rect({200, 200}, {100, 100}, 50), cv::Rect(50, 50, 100, 100));
    EXPECT_EQ(cut_hint_rect({200, 200}, {10, 190}, 50), cv::Rect(0, 140, 100, 60));
}

TEST_F(InteractiveCutTest, HintRectHugeExpansionCoversImage)
{
    EXPECT_EQ(cut_hint_rect({200, 120}, {100, 60}, INT_MAX), cv::Rect(0, 0, 200, 120));
    EXPECT_EQ(cut_hint_rect({200, 120}, {0, 0}, INT_MAX / 2 + 1), cv::Rect(0, 0, 200, 120));
}

TEST_F(InteractiveCutTest, PickSeedContourPrefersContaining)
{
    std::vector<Contour> contours = {
        {{0, 0}, {20, 0}, {20, 20}, {0, 20}},
        {{50, 50}, {90, 50}, {90, 90}, {50, 90}},
        {{60, 60}, {62, 60}, {62, 62}, {60, 62}},
    };
    EXPECT_EQ(pick_seed_contour(contours, {70, 70}, 100.0), 1);
    // nothing contains the seed: nearest centroid
    EXPECT_EQ(pick_seed_contour(contours, {25, 25}, 100.0), 0);
    EXPECT_EQ(pick_seed_contour(contours, {25, 25}, 1e6), -1);
}

TEST_F(InteractiveCutTest, DarkSquareOnLightBackground)
{
    auto res = cut.segment_at_point(img, 100, 100, 50);
    ASSERT_TRUE(res.has_value());

    const Region &r = res->region;
    EXPECT_TRUE(r.segmented());
    EXPECT_TRUE(r.is_freeform());
    EXPECT_EQ(r.name(), "segmented");
    EXPECT_TRUE(r.contains(cv::Point(100, 100)));
    EXPECT_GT(iou(r.bbox(), kSquare), 0.8);

    ASSERT_EQ(res->mask.size(), img.size());
    EXPECT_EQ(res->mask.type(), CV_8UC1);
    EXPECT_EQ(res->mask.at<uchar>(100, 100), 255);
    EXPECT_EQ(res->mask.at<uchar>(5, 5), 0);
}

TEST_F(InteractiveCutTest, RefinementKeepsBinaryMask)
{
    auto res = cut.segment_with_refinement(img, 100, 100, 50);
    ASSERT_TRUE(res.has_value());

    double lo = 0, hi = 0;
    cv::minMaxLoc(res->mask, &lo, &hi);
    EXPECT_EQ(lo, 0.0);
    EXPECT_EQ(hi, 255.0);
    const int nonBinary = cv::countNonZero((res->mask != 0) & (res->mask != 255));
    EXPECT_EQ(nonBinary, 0);
    EXPECT_EQ(res->mask.at<uchar>(100, 100), 255);
}

TEST_F(InteractiveCutTest, RegionCarriesMaskWindow)
{
    auto res = cut.segment_at_point(img, 100, 100, 50);
    ASSERT_TRUE(res.has_value());
    const Region &r = res->region;
    ASSERT_TRUE(r.has_mask());
    ASSERT_EQ(r.mask().size(), r.bbox().size());
    EXPECT_EQ(cv::countNonZero(r.mask() != res->mask(r.bbox())), 0);
    EXPECT_DOUBLE_EQ(r.area(), (double)cv::countNonZero(res->mask(r.bbox())));
}

TEST_F(InteractiveCutTest, RefinedMaskDrivesAlphaCutout)
{
    auto res = cut.segment_with_refinement(img, 100, 100, 80);
    ASSERT_TRUE(res.has_value());
    const Region &r = res->region;
    ASSERT_TRUE(r.has_mask());
    EXPECT_EQ(cv::countNonZero(r.mask() != res->mask(r.bbox())), 0);

    const cv::Mat out = create_transparent_crop(img, r.mask(), r);
    ASSERT_EQ(out.channels(), 4);
    ASSERT_EQ(out.size(), r.bbox().size());
    cv::Mat alpha;
    cv::extractChannel(out, alpha, 3);
    EXPECT_EQ(cv::countNonZero(alpha != res->mask(r.bbox())), 0);
}

TEST_F(InteractiveCutTest, WholeImageHintDoesNotThrow)
{
    // hint covers the whole image: either GrabCut fails (no result) or it still answers
    EXPECT_NO_THROW({
        auto res = cut.segment_at_point(img, 100, 100, 1000);
        if (res)
            EXPECT_EQ(res->mask.size(), img.size());
    });
}

TEST_F(InteractiveCutTest, DefaultOverloadsUseConfiguredExpansion)
{
    CutParams p;
    p.refine_expansion = 0;
    const InteractiveCutSegmenter badRefine(p);
    EXPECT_THROW(badRefine.segment_with_refinement(img, 100, 100), InputError);
    EXPECT_NO_THROW(badRefine.segment_at_point(img, 100, 100));

    p.refine_expansion = 80;
    p.expansion = 0;
    const InteractiveCutSegmenter badPlain(p);
    EXPECT_THROW(badPlain.segment_at_point(img, 100, 100), InputError);
    EXPECT_NO_THROW(badPlain.segment_with_refinement(img, 100, 100));
}

TEST_F(InteractiveCutTest, RejectsBadInput)
{
    EXPECT_THROW(cut.segment_at_point(cv::Mat(), 0, 0), InputError);
    EXPECT_THROW(cut.segment_at_point(img, 10, 10, 0), InputError);
}
