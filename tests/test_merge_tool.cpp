/**
 * @file test_merge_tool.cpp
 * @brief Superpixel selection state and manual / automatic merging
 */

#include "roix/merge_tool.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgproc.hpp>

#include <memory>
#include <set>
#include <vector>

using namespace roix;

namespace
{
    class GridBackend : public SuperpixelBackend
    {
    public:
        const char *name() const override { return "grid"; }
        cv::Mat compute_labels(const cv::Mat &bgr, const SuperpixelParams &params) const override
        {
            const int S = params.region_size;
            const int cols = (bgr.cols + S - 1) / S;
            cv::Mat labels(bgr.size(), CV_32S);
            for (int y = 0; y < bgr.rows; ++y)
                for (int x = 0; x < bgr.cols; ++x)
                    labels.at<int>(y, x) = (y / S) * cols + x / S;
            return labels;
        }
    };

    std::vector<std::unique_ptr<SuperpixelBackend>> grid_only()
    {
        std::vector<std::unique_ptr<SuperpixelBackend>> v;
        v.push_back(std::make_unique<GridBackend>());
        return v;
    }
}

class MergeToolTest : public ::testing::Test
{
protected:
    MergeToolTest() : engine(grid_only()), tool(engine) {}

    void segment(const cv::Mat &img, int cell)
    {
        SuperpixelParams p;
        p.region_size = cell;
        engine.segment(img, p);
    }

    SuperpixelEngine engine;
    SuperpixelMergeTool tool;
};

TEST_F(MergeToolTest, ClickIsIdempotent)
{
    segment(cv::Mat(60, 80, CV_8UC3, cv::Scalar(90, 90, 90)), 20);

    const SuperpixelRegion *hit = tool.click_select(25, 5);
    ASSERT_NE(hit, nullptr);
    tool.click_select(25, 5);
    EXPECT_EQ(tool.selection(), std::set<int>{hit->label});
}

TEST_F(MergeToolTest, AdditiveClickToggles)
{
    segment(cv::Mat(60, 80, CV_8UC3, cv::Scalar(90, 90, 90)), 20);

    tool.click_select(5, 5);
    tool.click_select(25, 5, true);
    EXPECT_EQ(tool.selection(), (std::set<int>{0, 1}));
    tool.click_select(5, 5, true);
    EXPECT_EQ(tool.selection(), std::set<int>{1});
}

TEST_F(MergeToolTest, ClickOutsideImage)
{
    segment(cv::Mat(60, 80, CV_8UC3, cv::Scalar(90, 90, 90)), 20);

    tool.click_select(5, 5);
    EXPECT_EQ(tool.click_select(500, 5, true), nullptr);
    EXPECT_EQ(tool.selection().size(), 1u);
    EXPECT_EQ(tool.click_select(500, 5), nullptr);
    EXPECT_TRUE(tool.selection().empty());
}

TEST_F(MergeToolTest, RectSelectOnlyAdds)
{
    segment(cv::Mat(60, 80, CV_8UC3, cv::Scalar(90, 90, 90)), 20);

    tool.click_select(75, 55);
    auto under = tool.rect_select(0, 0, 30, 10);
    EXPECT_EQ(under.size(), 2u);
    EXPECT_EQ(tool.selection(), (std::set<int>{0, 1, 11}));
    EXPECT_EQ(tool.selected_regions().size(), 3u);
}

TEST_F(MergeToolTest, MergeNeedsTwoAndClearsSelection)
{
    segment(cv::Mat(60, 80, CV_8UC3, cv::Scalar(90, 90, 90)), 20);

    tool.click_select(5, 5);
    EXPECT_FALSE(tool.merge_selected().has_value());
    EXPECT_EQ(tool.selection().size(), 1u);

    tool.click_select(25, 5, true);
    auto merged = tool.merge_selected();
    ASSERT_TRUE(merged.has_value());
    EXPECT_EQ(merged->bbox(), cv::Rect(0, 0, 40, 20));
    EXPECT_TRUE(tool.selection().empty());
    EXPECT_EQ(tool.merged_regions().size(), 1u);
}

TEST_F(MergeToolTest, AutoMergeJoinsIdenticalNeighbours)
{
    segment(cv::Mat(20, 40, CV_8UC3, cv::Scalar(10, 120, 240)), 20);
    ASSERT_EQ(engine.regions().size(), 2u);

    auto made = tool.auto_merge_all(1e9, 1.0);
    ASSERT_EQ(made.size(), 1u);
    EXPECT_EQ(made[0].bbox(), cv::Rect(0, 0, 40, 20));
    EXPECT_DOUBLE_EQ(made[0].area(), 800.0);
}

TEST_F(MergeToolTest, AutoMergeRespectsColorThreshold)
{
    cv::Mat img(20, 40, CV_8UC3, cv::Scalar(10, 120, 240));
    img(cv::Rect(20, 0, 20, 20)).setTo(cv::Scalar(240, 120, 10));
    segment(img, 20);

    EXPECT_TRUE(tool.auto_merge_all(1e9, 30.0).empty());
}

TEST_F(MergeToolTest, AutoMergeSkipsLargeRegions)
{
    segment(cv::Mat(20, 40, CV_8UC3, cv::Scalar(10, 120, 240)), 20);
    EXPECT_TRUE(tool.auto_merge_all(400.0, 1.0).empty()); // both areas are 400
}

TEST_F(MergeToolTest, StaleSelectionIsDropped)
{
    const cv::Mat img(60, 80, CV_8UC3, cv::Scalar(90, 90, 90));
    segment(img, 20);
    tool.rect_select(0, 0, 80, 60);
    ASSERT_EQ(tool.selection().size(), 12u);

    segment(img, 40);
    EXPECT_TRUE(tool.selection().empty());
    EXPECT_FALSE(tool.merge_selected().has_value());
}

TEST_F(MergeToolTest, FinalizeHandsOverMergedRegions)
{
    segment(cv::Mat(20, 40, CV_8UC3, cv::Scalar(10, 120, 240)), 20);
    tool.click_select(5, 5);
    tool.click_select(25, 5, true);
    ASSERT_TRUE(tool.merge_selected().has_value());

    auto out = tool.finalize();
    EXPECT_EQ(out.size(), 1u);
    EXPECT_TRUE(tool.merged_regions().empty());
    EXPECT_TRUE(tool.finalize().empty());
}

TEST_F(MergeToolTest, NothingSegmentedYet)
{
    EXPECT_EQ(tool.click_select(1, 1), nullptr);
    EXPECT_TRUE(tool.rect_select(0, 0, 10, 10).empty());
    EXPECT_TRUE(tool.auto_merge_all().empty());
}
