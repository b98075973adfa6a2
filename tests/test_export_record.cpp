/**
 * @file test_export_record.cpp
 * @brief Region <-> JSON export record schema
 */

#include "roix/errors.hpp"
#include "roix/export_record.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace roix;
using nlohmann::json;

TEST(ExportRecordTest, ImageRecordFields)
{
    Region r(10, 20, 30, 40, "logo");
    ExportAttributes a;
    a.node_name = "home";
    a.image_name = "logo.png";
    a.image_action = ImageAction::DetectAndClick;
    r.set_attributes(a);

    const json j = to_record(r);
    EXPECT_EQ(j.at("id"), r.id());
    EXPECT_EQ(j.at("name"), "logo");
    EXPECT_EQ(j.at("roi_type"), "image");
    EXPECT_EQ(j.at("x"), 10);
    EXPECT_EQ(j.at("height"), 40);
    EXPECT_EQ(j.at("center"), json::array({25, 40}));
    EXPECT_EQ(j.at("image_name"), "logo.png");
    EXPECT_EQ(j.at("image_action"), "detect_and_click");
    EXPECT_FALSE(j.contains("action"));
    EXPECT_FALSE(j.contains("click_mode"));
}

TEST(ExportRecordTest, ClickRecordCarriesOnlyClickFields)
{
    Region r(0, 0, 8, 8, "ok_button");
    ExportAttributes a;
    a.roi_type = RoiType::Region;
    a.action = Action::Click;
    a.click_mode = ClickMode::Loop;
    a.click_count = -1;
    a.click_interval_ms = 250;
    r.set_attributes(a);

    const json j = to_record(r);
    EXPECT_EQ(j.at("action"), "click");
    EXPECT_EQ(j.at("click_mode"), "loop");
    EXPECT_EQ(j.at("click_count"), -1);
    EXPECT_EQ(j.at("click_interval_ms"), 250);
    EXPECT_FALSE(j.contains("swipe_direction"));
    EXPECT_FALSE(j.contains("image_name"));

    const Region back = region_from_record(j);
    EXPECT_EQ(back.id(), r.id());
    EXPECT_EQ(back.bbox(), r.bbox());
    EXPECT_EQ(back.attributes().click_mode, ClickMode::Loop);
    EXPECT_EQ(back.attributes().click_count, -1);
}

TEST(ExportRecordTest, SwipeRecord)
{
    Region r(5, 5, 100, 300, "feed");
    ExportAttributes a;
    a.roi_type = RoiType::Region;
    a.action = Action::Swipe;
    a.swipe_direction = SwipeDirection::BottomToTop;
    a.swipe_speed_px_s = 900;
    r.set_attributes(a);

    const json j = to_record(r);
    EXPECT_EQ(j.at("swipe_direction"), "bottom_to_top");
    EXPECT_EQ(j.at("swipe_speed_px_s"), 900);
    EXPECT_FALSE(j.contains("click_count"));

    const Region back = region_from_record(j);
    EXPECT_EQ(back.attributes().swipe_direction, SwipeDirection::BottomToTop);
    EXPECT_EQ(back.attributes().swipe_speed_px_s, 900);
}

TEST(ExportRecordTest, MissingKeysTakeDefaults)
{
    const Region r = region_from_record(json{{"x", 1}, {"y", 2}, {"width", 3}, {"height", 4}});
    EXPECT_EQ(r.bbox(), cv::Rect(1, 2, 3, 4));
    EXPECT_EQ(r.attributes().roi_type, RoiType::Image);
    EXPECT_EQ(r.attributes().image_action, ImageAction::Detect);
    EXPECT_EQ(r.attributes().click_interval_ms, 500);
    EXPECT_EQ(r.attributes().swipe_speed_px_s, 400);
    EXPECT_EQ(r.id().size(), 8u);
}

TEST(ExportRecordTest, RejectsBadRecords)
{
    EXPECT_THROW(region_from_record(json::array()), InputError);
    EXPECT_THROW(region_from_record(json{{"width", 0}, {"height", 4}}), InputError);
    EXPECT_THROW(region_from_record(json{{"width", 3}, {"height", 4}, {"roi_type", "widget"}}), InputError);
    EXPECT_THROW(region_from_record(json{{"width", 3}, {"height", 4}, {"action", "tap"}}), InputError);
    EXPECT_THROW(region_from_record(json{{"width", "wide"}, {"height", 4}}), InputError);
}

TEST(ExportRecordTest, DocumentRoundTrip)
{
    RegionCollection coll;
    coll.add(Region(0, 0, 10, 10, "a"));
    coll.add(Region(20, 20, 5, 5, "b"));

    const json doc = to_document(coll);
    EXPECT_EQ(doc.at("roi_count"), 2);
    EXPECT_TRUE(doc.at("version").is_string());
    ASSERT_EQ(doc.at("rois").size(), 2u);

    RegionCollection loaded;
    loaded.add(Region(1, 1, 1, 1, "stale"));
    load_document(json::parse(doc.dump()), loaded);
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded.get(1)->name(), "b");
    EXPECT_EQ(loaded.get(1)->bbox(), cv::Rect(20, 20, 5, 5));
    EXPECT_FALSE(loaded.contains_name("stale"));

    EXPECT_THROW(load_document(json{{"rois", 3}}, loaded), InputError);
    EXPECT_EQ(loaded.size(), 2u);
}
