#include "roix/superpixel.hpp"
#include "roix/errors.hpp"
#include "roix/image.hpp"
#include "roix/log.hpp"

#include <opencv2/imgproc.hpp>
#include <opencv2/ximgproc.hpp>
#include <algorithm>
#include <cfloat>
#include <cmath>
#include <string>
#include <vector>

namespace roix
{
    bool SuperpixelBackend::probe() const
    {
        cv::Mat img(24, 24, CV_8UC3);
        for (int y = 0; y < img.rows; ++y)
            for (int x = 0; x < img.cols; ++x)
                img.at<cv::Vec3b>(y, x) = cv::Vec3b(uchar(x * 10), uchar(y * 10), 128);

        SuperpixelParams p;
        p.region_size = 8;
        try
        {
            cv::Mat labels = compute_labels(img, p);
            return !labels.empty() && labels.size() == img.size();
        }
        catch (const cv::Exception &ex)
        {
            log::w(std::string("superpixel backend ") + name() + " unavailable: " + ex.what());
        }
        catch (const Error &ex)
        {
            log::w(std::string("superpixel backend ") + name() + " unavailable: " + ex.what());
        }
        return false;
    }

    // ============================== ximgproc ==============================

    cv::Mat XimgprocSlicBackend::compute_labels(const cv::Mat &bgr, const SuperpixelParams &params) const
    {
        require_bgr(bgr, "ximgproc-slico");
        cv::Mat lab;
        cv::cvtColor(bgr, lab, cv::COLOR_BGR2Lab);

        cv::Ptr<cv::ximgproc::SuperpixelSLIC> slic;
        try
        {
            slic = cv::ximgproc::createSuperpixelSLIC(lab, cv::ximgproc::SLICO, params.region_size, params.ruler);
        }
        catch (const cv::Exception &ex)
        {
            log::d(std::string("SLICO rejected, using SLIC: ") + ex.what());
            slic = cv::ximgproc::createSuperpixelSLIC(lab, cv::ximgproc::SLIC, params.region_size, params.ruler);
        }

        slic->iterate(params.iterations);
        slic->enforceLabelConnectivity(params.min_element_size);

        cv::Mat labels;
        slic->getLabels(labels);
        return labels;
    }

    // ============================== native ==============================

    namespace
    {
        struct Center
        {
            float l, a, b, x, y;
        };

        inline float lab_dist2(const cv::Vec3f &p, const Center &c)
        {
            const float dl = p[0] - c.l, da = p[1] - c.a, db = p[2] - c.b;
            return dl * dl + da * da + db * db;
        }

        float gradient_at(const cv::Mat &lab, int x, int y)
        {
            const int x0 = std::max(0, x - 1), x1 = std::min(lab.cols - 1, x + 1);
            const int y0 = std::max(0, y - 1), y1 = std::min(lab.rows - 1, y + 1);
            const cv::Vec3f gx = lab.at<cv::Vec3f>(y, x1) - lab.at<cv::Vec3f>(y, x0);
            const cv::Vec3f gy = lab.at<cv::Vec3f>(y1, x) - lab.at<cv::Vec3f>(y0, x);
            return gx.dot(gx) + gy.dot(gy);
        }

        // Seeds on a regular grid, each nudged to the lowest gradient in its 3x3 neighbourhood.
        std::vector<Center> init_centers(const cv::Mat &lab, int S)
        {
            const int nx = std::max(1, (int)std::lround(double(lab.cols) / S));
            const int ny = std::max(1, (int)std::lround(double(lab.rows) / S));
            const double sx = double(lab.cols) / nx, sy = double(lab.rows) / ny;

            std::vector<Center> centers;
            centers.reserve(std::size_t(nx) * ny);
            for (int j = 0; j < ny; ++j)
                for (int i = 0; i < nx; ++i)
                {
                    int cx = std::min(lab.cols - 1, (int)((i + 0.5) * sx));
                    int cy = std::min(lab.rows - 1, (int)((j + 0.5) * sy));
                    int bx = cx, by = cy;
                    float best = gradient_at(lab, cx, cy);
                    for (int dy = -1; dy <= 1; ++dy)
                        for (int dx = -1; dx <= 1; ++dx)
                        {
                            const int px = cx + dx, py = cy + dy;
                            if (px < 0 || py < 0 || px >= lab.cols || py >= lab.rows)
                                continue;
                            const float g = gradient_at(lab, px, py);
                            if (g < best)
                            {
                                best = g;
                                bx = px;
                                by = py;
                            }
                        }
                    const cv::Vec3f &c = lab.at<cv::Vec3f>(by, bx);
                    centers.push_back({c[0], c[1], c[2], (float)bx, (float)by});
                }
            return centers;
        }

        // Relabels 4-connected pieces; pieces not larger than minSize join the
        // neighbouring piece found before them. Unassigned (-1) pixels are absorbed the same way.
        cv::Mat enforce_connectivity(const cv::Mat &labels, int minSize)
        {
            static const int dx4[] = {-1, 0, 1, 0};
            static const int dy4[] = {0, -1, 0, 1};

            const int W = labels.cols, H = labels.rows;
            cv::Mat out(H, W, CV_32S, cv::Scalar(-1));
            std::vector<cv::Point> piece;
            int next = 0;

            for (int y = 0; y < H; ++y)
                for (int x = 0; x < W; ++x)
                {
                    if (out.at<int>(y, x) >= 0)
                        continue;

                    int adjacent = -1;
                    for (int k = 0; k < 4; ++k)
                    {
                        const int nx = x + dx4[k], ny = y + dy4[k];
                        if (nx >= 0 && ny >= 0 && nx < W && ny < H && out.at<int>(ny, nx) >= 0)
                            adjacent = out.at<int>(ny, nx);
                    }

                    const int orig = labels.at<int>(y, x);
                    piece.clear();
                    piece.emplace_back(x, y);
                    out.at<int>(y, x) = next;
                    for (std::size_t c = 0; c < piece.size(); ++c)
                        for (int k = 0; k < 4; ++k)
                        {
                            const int nx = piece[c].x + dx4[k], ny = piece[c].y + dy4[k];
                            if (nx < 0 || ny < 0 || nx >= W || ny >= H)
                                continue;
                            if (out.at<int>(ny, nx) < 0 && labels.at<int>(ny, nx) == orig)
                            {
                                out.at<int>(ny, nx) = next;
                                piece.emplace_back(nx, ny);
                            }
                        }

                    if (adjacent >= 0 && ((int)piece.size() <= minSize || orig < 0))
                    {
                        for (const auto &p : piece)
                            out.at<int>(p) = adjacent;
                    }
                    else
                    {
                        ++next;
                    }
                }
            return out;
        }
    }

    cv::Mat NativeSlicBackend::compute_labels(const cv::Mat &bgr, const SuperpixelParams &params) const
    {
        require_bgr(bgr, "native-slic");
        const int S = params.region_size;
        const int W = bgr.cols, H = bgr.rows;

        cv::Mat lab;
        bgr.convertTo(lab, CV_32FC3, 1.0 / 255.0);
        cv::cvtColor(lab, lab, cv::COLOR_BGR2Lab);

        std::vector<Center> centers = init_centers(lab, S);
        const float spatial = (params.ruler * params.ruler) / float(S * S);

        cv::Mat labels(H, W, CV_32S, cv::Scalar(-1));
        cv::Mat dist(H, W, CV_32F);

        for (int it = 0; it < params.iterations; ++it)
        {
            dist.setTo(FLT_MAX);
            for (int k = 0; k < (int)centers.size(); ++k)
            {
                const Center &c = centers[k];
                const int xa = std::max(0, (int)(c.x - S)), xb = std::min(W - 1, (int)(c.x + S));
                const int ya = std::max(0, (int)(c.y - S)), yb = std::min(H - 1, (int)(c.y + S));
                for (int y = ya; y <= yb; ++y)
                {
                    const cv::Vec3f *lr = lab.ptr<cv::Vec3f>(y);
                    float *dr = dist.ptr<float>(y);
                    int *lbr = labels.ptr<int>(y);
                    for (int x = xa; x <= xb; ++x)
                    {
                        const float dx = x - c.x, dy = y - c.y;
                        const float D = lab_dist2(lr[x], c) + (dx * dx + dy * dy) * spatial;
                        if (D < dr[x])
                        {
                            dr[x] = D;
                            lbr[x] = k;
                        }
                    }
                }
            }

            std::vector<cv::Vec<double, 5>> sums(centers.size(), cv::Vec<double, 5>::all(0.0));
            std::vector<int> counts(centers.size(), 0);
            for (int y = 0; y < H; ++y)
            {
                const cv::Vec3f *lr = lab.ptr<cv::Vec3f>(y);
                const int *lbr = labels.ptr<int>(y);
                for (int x = 0; x < W; ++x)
                {
                    const int k = lbr[x];
                    if (k < 0)
                        continue;
                    sums[k] += cv::Vec<double, 5>(lr[x][0], lr[x][1], lr[x][2], x, y);
                    ++counts[k];
                }
            }
            for (std::size_t k = 0; k < centers.size(); ++k)
            {
                if (counts[k] == 0)
                    continue;
                const cv::Vec<double, 5> m = sums[k] / double(counts[k]);
                centers[k] = {(float)m[0], (float)m[1], (float)m[2], (float)m[3], (float)m[4]};
            }
        }

        const int minSize = std::max(1, S * S * params.min_element_size / 100);
        return enforce_connectivity(labels, minSize);
    }
}
