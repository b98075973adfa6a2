#pragma once
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstdint>

namespace roix
{
    // Non-owning view of caller pixels (3 interleaved 8-bit channels, BGR order).
    struct PixelBuffer
    {
        int width{0};
        int height{0};
        std::size_t stride{0}; // bytes per row
        int channels{3};
        const std::uint8_t *data{nullptr};
    };

    // Deep copy into an owned CV_8UC3 matrix. Throws InputError on malformed buffers.
    cv::Mat to_mat(const PixelBuffer &buf);

    // Throws InputError unless img is a non-empty CV_8UC3 image.
    void require_bgr(const cv::Mat &img, const char *who);
}
