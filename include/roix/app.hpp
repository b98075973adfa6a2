#pragma once
#include "roix/color_flood.hpp"
#include "roix/geometric_detector.hpp"
#include "roix/interactive_cut.hpp"
#include "roix/merge_tool.hpp"
#include "roix/region.hpp"
#include "roix/superpixel.hpp"

#include <opencv2/core.hpp>
#include <string>

namespace roix::app
{
    struct State
    {
        std::string imagePath;
        bool hasImage{false};
        cv::Mat image; // BGR
        bool debug{false};
        bool saveOutputs{false};

        RegionCollection regions;

        DetectorParams detector;
        FloodParams flood;
        CutParams cut;
        SuperpixelParams superpixel;
        double autoMergeMinArea{500.0};
        double autoMergeColor{30.0};
    };

    class Application
    {
    public:
        Application();

        int run();

    private:
        State state_{};
        SuperpixelEngine engine_;
        SuperpixelMergeTool mergeTool_;

        int main_loop();
        void auto_detect();
        void flood_at_point();
        void cut_at_point();
        void superpixel_session();
        void regions_view();
    };
}
