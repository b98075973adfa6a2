/**
 * @file test_region.cpp
 * @brief Region value type, RegionCollection, pixel buffer and crop helpers
 */

#include "roix/crop.hpp"
#include "roix/errors.hpp"
#include "roix/image.hpp"
#include "roix/region.hpp"

#include <gtest/gtest.h>
#include <opencv2/core.hpp>

#include <cstdint>
#include <set>
#include <vector>

using namespace roix;

// ============================================================================
// Region
// ============================================================================

TEST(RegionTest, RejectsNonPositiveSize)
{
    EXPECT_THROW(Region(0, 0, 0, 10), InputError);
    EXPECT_THROW(Region(0, 0, 10, -1), InputError);
    EXPECT_NO_THROW(Region(5, 5, 1, 1));
}

TEST(RegionTest, DerivedGeometry)
{
    Region r(10, 20, 30, 40, "a");
    EXPECT_EQ(r.right(), 40);
    EXPECT_EQ(r.bottom(), 60);
    EXPECT_EQ(r.center(), cv::Point(25, 40));
    EXPECT_EQ(r.bbox_area(), 1200);
    EXPECT_DOUBLE_EQ(r.area(), 1200.0);
    EXPECT_TRUE(r.is_rect());
    EXPECT_TRUE(r.contains({10, 20}));
    EXPECT_FALSE(r.contains({40, 60}));
}

TEST(RegionTest, IdIsEightHexChars)
{
    Region r(0, 0, 4, 4);
    ASSERT_EQ(r.id().size(), 8u);
    for (char c : r.id())
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << r.id();
}

TEST(RegionTest, CircleRadiusIsClipped)
{
    Region c = Region::circle({0, 0, 20, 10}, {10, 5}, 50, "c");
    ASSERT_TRUE(c.is_circle());
    EXPECT_EQ(c.circle_shape()->radius, 10);
    EXPECT_THROW(Region::circle({0, 0, 20, 10}, {30, 5}, 3), InputError);
}

TEST(RegionTest, MaskAreaCountsPixels)
{
    Region r(0, 0, 10, 10);
    cv::Mat m(10, 10, CV_8U, cv::Scalar(0));
    m(cv::Rect(0, 0, 5, 4)).setTo(255);
    r.set_mask(m);
    EXPECT_DOUBLE_EQ(r.area(), 20.0);
    EXPECT_THROW(r.set_mask(cv::Mat(5, 5, CV_8U, cv::Scalar(0))), InputError);
}

TEST(RegionTest, TranslateMovesShapeAndKeepsMask)
{
    Region f = Region::freeform({10, 10, 4, 4}, {{10, 10}, {13, 10}, {13, 13}, {10, 13}});
    f.set_mask(cv::Mat(4, 4, CV_8U, cv::Scalar(255)));
    f.translate(5, -2);
    EXPECT_EQ(f.bbox(), cv::Rect(15, 8, 4, 4));
    EXPECT_EQ(f.contour()->front(), cv::Point(15, 8));
    EXPECT_TRUE(f.has_mask());

    f.set_bbox({15, 8, 6, 6});
    EXPECT_FALSE(f.has_mask());
}

TEST(RegionTest, CopyGetsFreshIdAndOwnMask)
{
    Region r(0, 0, 4, 4, "orig");
    r.set_mask(cv::Mat(4, 4, CV_8U, cv::Scalar(255)));
    Region c = r.copy_as("dup");
    EXPECT_NE(c.id(), r.id());
    EXPECT_EQ(c.name(), "dup");
    cv::Mat shared = c.mask();
    shared.setTo(0);
    EXPECT_DOUBLE_EQ(r.area(), 16.0);
}

TEST(RegionTest, NumberedName)
{
    EXPECT_EQ(numbered_name("auto", 3), "auto_03");
    EXPECT_EQ(numbered_name("circle", 12), "circle_12");
}

// ============================================================================
// RegionCollection
// ============================================================================

TEST(RegionCollectionTest, DefaultAndUniqueNames)
{
    RegionCollection coll;
    coll.add(Region(0, 0, 5, 5));
    coll.add(Region(0, 0, 5, 5, "btn"));
    coll.add(Region(0, 0, 5, 5, "btn"));
    ASSERT_EQ(coll.size(), 3u);
    EXPECT_EQ(coll.get(0)->name(), "ROI_001");
    EXPECT_EQ(coll.get(1)->name(), "btn");
    EXPECT_EQ(coll.get(2)->name(), "btn_2");
}

TEST(RegionCollectionTest, SelectCopyRemove)
{
    RegionCollection coll;
    coll.add(Region(0, 0, 10, 10, "a"));
    coll.add(Region(50, 50, 10, 10, "b"));

    EXPECT_EQ(coll.select_at({55, 55}), 1);
    Region *copy = coll.copy_selected();
    ASSERT_NE(copy, nullptr);
    EXPECT_EQ(copy->name(), "b_copy");
    EXPECT_EQ(copy->bbox(), cv::Rect(70, 70, 10, 10));
    EXPECT_EQ(coll.selected_index(), 2);

    EXPECT_TRUE(coll.remove(0));
    EXPECT_EQ(coll.selected_index(), 1);
    EXPECT_TRUE(coll.remove_selected());
    EXPECT_EQ(coll.selected_index(), -1);
    EXPECT_EQ(coll.size(), 1u);
    EXPECT_FALSE(coll.remove(5));
}

TEST(RegionCollectionTest, MissSelectsNothing)
{
    RegionCollection coll;
    coll.add(Region(0, 0, 10, 10));
    EXPECT_EQ(coll.select_at({100, 100}), -1);
    EXPECT_EQ(coll.copy_selected(), nullptr);
}

TEST(RegionCollectionTest, ResizeEachHandle)
{
    // rect (10,10)-(50,40), exclusive right/bottom
    const cv::Point pos(60, 55);
    const cv::Rect expected[RegionCollection::kHandleCount] = {
        {50, 40, 10, 15}, // top-left dragged past bottom-right: flipped
        {10, 40, 40, 15}, // top past bottom
        {10, 40, 50, 15}, // top-right
        {50, 10, 10, 30}, // left past right
        {10, 10, 50, 30}, // right
        {50, 10, 10, 45}, // bottom-left
        {10, 10, 40, 45}, // bottom
        {10, 10, 50, 45}, // bottom-right
    };
    for (int h = 0; h < RegionCollection::kHandleCount; ++h)
    {
        RegionCollection c;
        c.add(Region(10, 10, 40, 30));
        ASSERT_TRUE(c.resize(0, h, pos));
        EXPECT_EQ(c.get(0)->bbox(), expected[h]) << "handle " << h;
    }
}

TEST(RegionCollectionTest, ResizeInsideKeepsOrientation)
{
    RegionCollection c;
    c.add(Region(10, 10, 40, 30));
    ASSERT_TRUE(c.resize(0, 0, {20, 15}));
    EXPECT_EQ(c.get(0)->bbox(), cv::Rect(20, 15, 30, 25));
    ASSERT_TRUE(c.resize(0, 7, {0, 0}));
    EXPECT_EQ(c.get(0)->bbox(), cv::Rect(0, 0, 20, 15));
}

TEST(RegionCollectionTest, ResizeRejectsBadInput)
{
    RegionCollection c;
    c.add(Region(10, 10, 40, 30));
    EXPECT_FALSE(c.resize(3, 0, {0, 0}));
    EXPECT_THROW(c.resize(0, 8, {0, 0}), InputError);
    EXPECT_THROW(c.resize(0, -1, {0, 0}), InputError);
    EXPECT_THROW(c.resize(0, 4, {10, 20}), InputError);
    EXPECT_THROW(c.resize(0, 6, {30, 10}), InputError);
    EXPECT_EQ(c.get(0)->bbox(), cv::Rect(10, 10, 40, 30));
}

TEST(RegionCollectionTest, ResizeHandleHitTest)
{
    RegionCollection c;
    c.add(Region(10, 10, 40, 30));
    EXPECT_EQ(c.resize_handle_at({10, 10}, 0), 0);
    EXPECT_EQ(c.resize_handle_at({33, 7}, 0), 1);
    EXPECT_EQ(c.resize_handle_at({50, 10}, 0), 2);
    EXPECT_EQ(c.resize_handle_at({9, 25}, 0), 3);
    EXPECT_EQ(c.resize_handle_at({54, 25}, 0), 4);
    EXPECT_EQ(c.resize_handle_at({10, 40}, 0), 5);
    EXPECT_EQ(c.resize_handle_at({30, 40}, 0), 6);
    EXPECT_EQ(c.resize_handle_at({50, 40}, 0), 7);
    EXPECT_EQ(c.resize_handle_at({30, 25}, 0), -1);
    EXPECT_EQ(c.resize_handle_at({10, 10}, 1), -1);
}

// ============================================================================
// PixelBuffer / crop
// ============================================================================

TEST(PixelBufferTest, CopiesWithStride)
{
    std::vector<std::uint8_t> data(2 * 8, 0);
    data[0] = 1;
    data[8] = 2; // second row starts after 8 bytes of stride
    PixelBuffer buf{2, 2, 8, 3, data.data()};
    cv::Mat m = to_mat(buf);
    ASSERT_EQ(m.type(), CV_8UC3);
    EXPECT_EQ(m.at<cv::Vec3b>(0, 0)[0], 1);
    EXPECT_EQ(m.at<cv::Vec3b>(1, 0)[0], 2);

    data[0] = 99;
    EXPECT_EQ(m.at<cv::Vec3b>(0, 0)[0], 1);
}

TEST(PixelBufferTest, RejectsMalformedBuffers)
{
    std::vector<std::uint8_t> data(64, 0);
    EXPECT_THROW(to_mat(PixelBuffer{0, 2, 6, 3, data.data()}), InputError);
    EXPECT_THROW(to_mat(PixelBuffer{2, 2, 6, 3, nullptr}), InputError);
    EXPECT_THROW(to_mat(PixelBuffer{2, 2, 5, 3, data.data()}), InputError);
    EXPECT_THROW(to_mat(PixelBuffer{2, 2, 8, 4, data.data()}), InputError);
}

TEST(CropTest, BboxCropAndAlphaCutout)
{
    cv::Mat img(50, 50, CV_8UC3, cv::Scalar(10, 20, 30));
    Region r(40, 40, 20, 20);
    cv::Mat crop = crop_region(img, r);
    EXPECT_EQ(crop.size(), cv::Size(10, 10));

    cv::Mat mask(50, 50, CV_8U, cv::Scalar(0));
    mask(cv::Rect(45, 45, 5, 5)).setTo(255);
    cv::Mat cut = create_transparent_crop(img, mask, r);
    ASSERT_EQ(cut.type(), CV_8UC4);
    EXPECT_EQ(cut.size(), cv::Size(10, 10));
    EXPECT_EQ(cut.at<cv::Vec4b>(0, 0)[3], 0);
    EXPECT_EQ(cut.at<cv::Vec4b>(9, 9)[3], 255);
    EXPECT_EQ(cut.at<cv::Vec4b>(9, 9)[2], 30);

    EXPECT_THROW(crop_region(img, Region(100, 100, 5, 5)), InputError);
    EXPECT_THROW(create_transparent_crop(img, cv::Mat(3, 3, CV_8U, cv::Scalar(0)), r), InputError);
}
