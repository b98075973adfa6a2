#pragma once
#include "roix/geometry.hpp"

#include <opencv2/core.hpp>
#include <chrono>
#include <string>
#include <variant>
#include <vector>

namespace roix
{
    struct RectShape
    {
    };

    struct CircleShape
    {
        cv::Point center;
        int radius{0};
    };

    struct FreeformShape
    {
        Contour contour; // image coordinates
    };

    using Shape = std::variant<RectShape, CircleShape, FreeformShape>;

    // Export-side attributes; the core only carries them for the collaborators.
    enum class RoiType
    {
        Image,
        Region
    };
    enum class ImageAction
    {
        Detect,
        DetectAndClick
    };
    enum class Action
    {
        None,
        Click,
        Ocr,
        Swipe
    };
    enum class ClickMode
    {
        Single,
        Loop
    };
    enum class SwipeDirection
    {
        TopToBottom,
        BottomToTop,
        LeftToRight,
        RightToLeft
    };

    struct ExportAttributes
    {
        std::string node_name;
        std::string image_name;
        RoiType roi_type{RoiType::Image};
        ImageAction image_action{ImageAction::Detect};
        Action action{Action::None};
        ClickMode click_mode{ClickMode::Single};
        int click_count{1}; // -1 = until stopped
        int click_interval_ms{500};
        SwipeDirection swipe_direction{SwipeDirection::TopToBottom};
        int swipe_speed_px_s{400};
    };

    class Region
    {
    public:
        using Clock = std::chrono::system_clock;

        // Throws InputError when w <= 0 or h <= 0.
        Region(int x, int y, int w, int h, std::string name = {});
        explicit Region(const cv::Rect &bbox, std::string name = {});

        // center must lie inside bbox; radius is clipped so that 2r <= max(w,h).
        static Region circle(const cv::Rect &bbox, cv::Point center, int radius, std::string name = {});
        static Region freeform(const cv::Rect &bbox, Contour contour, std::string name = {});

        const std::string &id() const { return id_; }
        void set_id(std::string id);

        const std::string &name() const { return name_; }
        void set_name(std::string name);

        int x() const { return bbox_.x; }
        int y() const { return bbox_.y; }
        int width() const { return bbox_.width; }
        int height() const { return bbox_.height; }
        int right() const { return bbox_.x + bbox_.width; }
        int bottom() const { return bbox_.y + bbox_.height; }
        const cv::Rect &bbox() const { return bbox_; }
        cv::Point center() const { return {bbox_.x + bbox_.width / 2, bbox_.y + bbox_.height / 2}; }
        int bbox_area() const { return bbox_.area(); }

        // Mask pixel count when a mask is attached, bbox area otherwise.
        double area() const;

        bool contains(const cv::Point &p) const { return bbox_.contains(p); }

        const Shape &shape() const { return shape_; }
        bool is_rect() const { return std::holds_alternative<RectShape>(shape_); }
        bool is_circle() const { return std::holds_alternative<CircleShape>(shape_); }
        bool is_freeform() const { return std::holds_alternative<FreeformShape>(shape_); }
        const CircleShape *circle_shape() const { return std::get_if<CircleShape>(&shape_); }
        const Contour *contour() const;

        // bbox-sized CV_8U mask; an empty Mat detaches the mask.
        const cv::Mat &mask() const { return mask_; }
        bool has_mask() const { return !mask_.empty(); }
        void set_mask(cv::Mat mask);

        bool segmented() const { return segmented_; }
        void set_segmented(bool s);

        // Resizing drops a mask that no longer matches the bbox.
        void set_bbox(const cv::Rect &bbox);
        void translate(int dx, int dy);

        const ExportAttributes &attributes() const { return attrs_; }
        void set_attributes(ExportAttributes attrs);

        Clock::time_point created_at() const { return created_at_; }
        Clock::time_point modified_at() const { return modified_at_; }

        // Same geometry and attributes under a fresh id.
        Region copy_as(std::string name) const;

    private:
        void touch() { modified_at_ = Clock::now(); }

        std::string id_;
        std::string name_;
        cv::Rect bbox_;
        Shape shape_{RectShape{}};
        cv::Mat mask_;
        bool segmented_{false};
        ExportAttributes attrs_;
        Clock::time_point created_at_;
        Clock::time_point modified_at_;
    };

    // 8 lowercase hex characters.
    std::string make_region_id();

    // "auto", 3 -> "auto_03"
    std::string numbered_name(const std::string &prefix, int n);

    class RegionCollection
    {
    public:
        // Returns the index of the new region. Empty names become ROI_NNN,
        // colliding names get a numeric suffix.
        int add(Region r);
        bool remove(int index);
        bool remove_selected();

        Region *get(int index);
        const Region *get(int index) const;

        int selected_index() const { return selected_; }
        Region *selected() { return get(selected_); }
        void select(int index);
        int select_at(const cv::Point &p);

        Region *copy_selected();
        bool move(int index, int dx, int dy);

        // Handles: 0 top-left, 1 top, 2 top-right, 3 left, 4 right,
        // 5 bottom-left, 6 bottom, 7 bottom-right. Right and bottom edges
        // are exclusive (x + width, y + height).
        static constexpr int kHandleCount = 8;
        static constexpr int kHandleTolerance = 4;

        // Handle within kHandleTolerance of p, or -1.
        int resize_handle_at(const cv::Point &p, int index) const;

        // Moves the edges named by handle to pos and normalizes the rect, so
        // dragging past the opposite edge flips it. False for an unknown
        // index; InputError for an unknown handle or a zero-size result.
        bool resize(int index, int handle, const cv::Point &pos);
        void clear();

        bool contains_name(const std::string &name) const;

        std::size_t size() const { return regions_.size(); }
        bool empty() const { return regions_.empty(); }
        const std::vector<Region> &regions() const { return regions_; }
        std::vector<Region>::const_iterator begin() const { return regions_.begin(); }
        std::vector<Region>::const_iterator end() const { return regions_.end(); }

    private:
        std::string unique_name(const std::string &wanted) const;

        std::vector<Region> regions_;
        int selected_{-1};
        int name_counter_{0};
    };
}
