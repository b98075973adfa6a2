#include "roix/crop.hpp"
#include "roix/errors.hpp"

#include <opencv2/imgproc.hpp>

namespace roix
{
    cv::Mat crop_region(const cv::Mat &img, const Region &region)
    {
        if (img.empty())
            throw InputError("crop_region: empty image");
        const cv::Rect box = clamp_rect(region.bbox(), img.size());
        if (box.empty())
            throw InputError("crop_region: region lies outside the image");
        return img(box).clone();
    }

    cv::Mat create_transparent_crop(const cv::Mat &img, const cv::Mat &mask, const Region &region)
    {
        if (img.empty() || mask.empty())
            throw InputError("create_transparent_crop: empty image or mask");
        if (mask.type() != CV_8UC1)
            throw InputError("create_transparent_crop: mask must be CV_8UC1");

        const cv::Rect box = clamp_rect(region.bbox(), img.size());
        if (box.empty())
            throw InputError("create_transparent_crop: region lies outside the image");

        cv::Mat alpha;
        if (mask.size() == img.size())
            alpha = mask(box);
        else if (mask.size() == region.bbox().size())
            alpha = mask(box - region.bbox().tl());
        else
            throw InputError("create_transparent_crop: mask must be image- or bbox-sized");

        cv::Mat bgra;
        if (img.channels() == 1)
            cv::cvtColor(img(box), bgra, cv::COLOR_GRAY2BGRA);
        else
            cv::cvtColor(img(box), bgra, cv::COLOR_BGR2BGRA);

        cv::Mat channels[4];
        cv::split(bgra, channels);
        alpha.copyTo(channels[3]);
        cv::merge(channels, 4, bgra);
        return bgra;
    }
}
