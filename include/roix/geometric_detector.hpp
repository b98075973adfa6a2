#pragma once
#include "roix/region.hpp"

#include <opencv2/core.hpp>
#include <vector>

namespace roix
{
    // Empirical constants tuned for phone-resolution UI screenshots.
    struct DetectorParams
    {
        // circles (Hough gradient)
        int circle_median_ksize = 5;
        double circle_dp = 1.0;
        double circle_min_dist = 20.0;
        double circle_canny_high = 50.0;
        double circle_acc_threshold = 30.0;
        int circle_min_radius = 5;
        int circle_max_radius = 100;

        // red dots (HSV, OpenCV hue 0..180)
        int red_low_hue_max = 10;
        int red_high_hue_min = 160;
        int red_s_min = 100;
        int red_v_min = 100;
        int red_close_iters = 2;
        double red_min_area = 30.0;
        double red_max_area = 5000.0;
        double red_min_circularity = 0.6;

        // buttons (adaptive threshold)
        int button_block = 11;
        double button_c = 2.0;
        int button_close_k = 5;
        int button_close_iters = 2;
        double button_min_area = 200.0;
        double button_max_area_frac = 0.5;
        double button_min_aspect = 0.1;
        double button_max_aspect = 10.0;
        double button_approx_eps_frac = 0.02;
        int button_min_vertices = 4;

        // icons (edges)
        int icon_canny_low = 50;
        int icon_canny_high = 150;
        int icon_dilate_iters = 1;
        double icon_min_area = 100.0;
        double icon_max_area_frac = 0.3;
        double icon_max_aspect = 2.0;

        // margin added around circle-derived boxes
        int circle_margin = 2;

        double merge_iou = 0.3;
    };

    // Shape-based candidate detectors. Every detector returns an empty list when
    // nothing qualifies and throws InputError for an empty or non-BGR image.
    class GeometricDetector
    {
    public:
        GeometricDetector() = default;
        explicit GeometricDetector(const DetectorParams &params) : params_(params) {}

        const DetectorParams &params() const { return params_; }

        std::vector<Region> detect_circles(const cv::Mat &bgr) const;
        std::vector<Region> detect_circles(const cv::Mat &bgr, int minRadius, int maxRadius) const;
        std::vector<Region> detect_red_dots(const cv::Mat &bgr) const;
        std::vector<Region> detect_ui_buttons(const cv::Mat &bgr) const;
        std::vector<Region> detect_icons(const cv::Mat &bgr) const;

        // All four, deduplicated by RegionMerger and renamed auto_NN.
        std::vector<Region> detect_all(const cv::Mat &bgr) const;

        // Circles blue, everything else green, each labelled with its name.
        static cv::Mat draw_preview(const cv::Mat &bgr, const std::vector<Region> &regions);

    private:
        DetectorParams params_;
    };
}
