#pragma once
#include "roix/geometric_detector.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace roix::app::progress
{
    struct BatchOptions
    {
        DetectorParams detector;
        bool debug{false};
        bool saveOutputs{false}; // per-image JSON document, preview and crops
    };

    // Default root is ./roix_output, override with env ROIX_OUTPUT_ROOT.
    std::filesystem::path output_root();

    // YYYYMMDD-HHMMSS, local time
    std::string now_stamp();

    // Run detect_all over every image, print to console and save outputs.
    // - CSV:     <root>/results/<stamp>.csv
    // - Outputs: <root>/runs/<stamp>/<index>_<name>{.json,_preview.png,_crops/}
    // Returns the number of images that could not be processed.
    int process_and_report(const std::vector<std::string> &images, const BatchOptions &opts);

    // Writes each region's bbox crop as <dir>/<name>.png; returns files written.
    int save_crops(const cv::Mat &img, const std::vector<Region> &regions, const std::filesystem::path &dir);
}
