#include "roix/image.hpp"
#include "roix/errors.hpp"

#include <cstring>
#include <string>

namespace roix
{
    cv::Mat to_mat(const PixelBuffer &buf)
    {
        if (!buf.data)
            throw InputError("pixel buffer has no data");
        if (buf.width <= 0 || buf.height <= 0)
            throw InputError("pixel buffer is empty (" + std::to_string(buf.width) + "x" +
                             std::to_string(buf.height) + ")");
        if (buf.channels != 3)
            throw InputError("pixel buffer must have 3 channels, got " + std::to_string(buf.channels));

        const std::size_t rowBytes = std::size_t(buf.width) * 3;
        if (buf.stride < rowBytes)
            throw InputError("pixel buffer stride is smaller than a row");

        cv::Mat out(buf.height, buf.width, CV_8UC3);
        for (int y = 0; y < buf.height; ++y)
            std::memcpy(out.ptr<uchar>(y), buf.data + std::size_t(y) * buf.stride, rowBytes);
        return out;
    }

    void require_bgr(const cv::Mat &img, const char *who)
    {
        if (img.empty())
            throw InputError(std::string(who) + ": empty image");
        if (img.type() != CV_8UC3)
            throw InputError(std::string(who) + ": expected an 8-bit 3-channel image");
    }
}
