#pragma once
#include "roix/region.hpp"
#include <opencv2/core.hpp>

namespace roix
{
    // Deep copy of the region bbox (clipped to the image).
    cv::Mat crop_region(const cv::Mat &img, const Region &region);

    // BGRA cutout of the region bbox whose alpha channel is the mask.
    // mask may be image-sized or bbox-sized; anything else is an InputError.
    cv::Mat create_transparent_crop(const cv::Mat &img, const cv::Mat &mask, const Region &region);
}
