#include "roix/progress.hpp"
#include "roix/ansi.hpp"
#include "roix/crop.hpp"
#include "roix/errors.hpp"
#include "roix/export_record.hpp"
#include "roix/log.hpp"

#include <opencv2/imgcodecs.hpp>

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace
{
    void ensure_dir(const fs::path &p)
    {
        std::error_code ec;
        fs::create_directories(p, ec);
        if (ec)
            roix::log::w("cannot create " + p.string() + ": " + ec.message());
    }

    void count_kinds(const std::vector<roix::Region> &regions, int &circles, int &others)
    {
        circles = 0;
        others = 0;
        for (const auto &r : regions)
            (r.is_circle() ? circles : others)++;
    }
}

namespace roix::app::progress
{
    fs::path output_root()
    {
        const char *env = std::getenv("ROIX_OUTPUT_ROOT");
        if (env && *env)
            return fs::path(env);
        return fs::current_path() / "roix_output";
    }

    std::string now_stamp()
    {
        using clock = std::chrono::system_clock;
        auto t = clock::to_time_t(clock::now());
        std::tm tm{};
#if defined(_WIN32)
        localtime_s(&tm, &t);
#else
        localtime_r(&t, &tm);
#endif
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y%m%d-%H%M%S");
        return oss.str();
    }

    int save_crops(const cv::Mat &img, const std::vector<Region> &regions, const fs::path &dir)
    {
        ensure_dir(dir);
        int written = 0;
        for (const auto &r : regions)
        {
            cv::Mat out;
            try
            {
                out = r.has_mask() ? create_transparent_crop(img, r.mask(), r) : crop_region(img, r);
            }
            catch (const Error &ex)
            {
                log::w(r.name() + ": " + ex.what());
                continue;
            }
            const fs::path file = dir / (r.name() + ".png");
            if (cv::imwrite(file.string(), out))
                ++written;
            else
                log::w("failed to write " + file.string());
        }
        return written;
    }

    int process_and_report(const std::vector<std::string> &images, const BatchOptions &opts)
    {
        using clock = std::chrono::steady_clock;
        using std::chrono::duration_cast;
        using std::chrono::milliseconds;

        log::set(opts.debug);

        const fs::path root = output_root();
        const std::string ts = now_stamp();
        const fs::path resultsDir = root / "results";
        const fs::path runDir = root / "runs" / ts;

        ensure_dir(resultsDir);
        if (opts.saveOutputs)
            ensure_dir(runDir);

        const fs::path csvPath = resultsDir / (ts + ".csv");
        std::ofstream csv(csvPath);
        if (!csv)
            log::w("cannot open " + csvPath.string() + " for writing");

        csv << "index,input_path,ok,width,height,regions,circles,others,"
               "json_path,preview_path,crops_written,elapsed_ms\n";

        const int N = static_cast<int>(images.size());
        std::cout << ansi::title << "Running auto-detect on " << N
                  << " image(s)" << ansi::reset << "\n\n";
        std::cout << ansi::muted << "Results CSV: " << csvPath.string()
                  << ansi::reset << "\n";
        if (opts.saveOutputs)
            std::cout << ansi::muted << "Output dir : " << runDir.string()
                      << ansi::reset << "\n";
        std::cout << "\n";

        const GeometricDetector detector(opts.detector);
        long long total_ms_accum = 0;
        int failed = 0;
        int totalRegions = 0;
        int i = 0;

        auto run_t0 = clock::now();

        for (const auto &path : images)
        {
            ++i;
            std::cout << ansi::muted << "(" << i << "/" << N << ")"
                      << ansi::reset << " Processing: " << path << "\n";

            auto t0 = clock::now();

            cv::Mat img = cv::imread(path, cv::IMREAD_COLOR);
            std::vector<Region> regions;
            std::string error;
            if (img.empty())
            {
                error = "failed to read image";
            }
            else
            {
                try
                {
                    regions = detector.detect_all(img);
                }
                catch (const Error &ex)
                {
                    error = ex.what();
                }
                catch (const cv::Exception &ex)
                {
                    error = ex.what();
                }
            }

            if (!error.empty())
            {
                long long ms = duration_cast<milliseconds>(clock::now() - t0).count();
                total_ms_accum += ms;
                ++failed;

                std::cout << ansi::err << error << ansi::reset
                          << ansi::muted << " [" << ms << " ms]" << ansi::reset << "\n";
                csv << i << "," << '"' << path << '"' << ",0,,,,,,,,," << ms << "\n";
                continue;
            }

            std::string jsonPath, previewPath;
            int crops = 0;
            if (opts.saveOutputs)
            {
                const std::string prefix = std::to_string(i) + "_" + fs::path(path).stem().string();

                RegionCollection coll;
                for (auto &r : regions)
                    coll.add(r);
                jsonPath = (runDir / (prefix + ".json")).string();
                std::ofstream js(jsonPath);
                js << to_document(coll).dump(2) << "\n";

                previewPath = (runDir / (prefix + "_preview.png")).string();
                if (!cv::imwrite(previewPath, GeometricDetector::draw_preview(img, regions)))
                {
                    log::w("failed to write " + previewPath);
                    previewPath.clear();
                }
                crops = save_crops(img, regions, runDir / (prefix + "_crops"));
            }

            int circles = 0, others = 0;
            count_kinds(regions, circles, others);
            totalRegions += static_cast<int>(regions.size());

            std::cout << path << "  " << regions.size() << " region(s)  "
                      << ansi::muted << "(circles=" << circles << ", other=" << others << ")"
                      << ansi::reset << "\n";
            for (const auto &r : regions)
                log::d("  " + r.name() + " [" + std::to_string(r.x()) + "," + std::to_string(r.y()) + " " +
                       std::to_string(r.width()) + "x" + std::to_string(r.height()) + "]");
            if (opts.saveOutputs)
                std::cout << ansi::ok << "        Saved " << crops << " crop(s)." << ansi::reset << "\n";

            long long ms = duration_cast<milliseconds>(clock::now() - t0).count();
            total_ms_accum += ms;
            std::cout << ansi::muted << "        [" << ms << " ms]" << ansi::reset << "\n";

            csv << i << "," << '"' << path << '"' << ",1,"
                << img.cols << "," << img.rows << ","
                << regions.size() << "," << circles << "," << others << ",";
            if (opts.saveOutputs)
                csv << '"' << jsonPath << '"' << "," << '"' << previewPath << '"' << "," << crops << ",";
            else
                csv << ",,,";
            csv << ms << "\n";
        }

        auto run_t1 = clock::now();
        long long run_ms = duration_cast<milliseconds>(run_t1 - run_t0).count();
        double avg_ms = (N > 0) ? (double)total_ms_accum / (double)N : 0.0;
        double ips = (run_ms > 0) ? (1000.0 * (double)N / (double)run_ms) : 0.0;

        std::cout << "\n"
                  << ansi::bold << "Processed " << (N - failed) << "/" << N << ansi::reset
                  << " images, " << totalRegions << " region(s) total.\n"
                  << ansi::muted
                  << "Total: " << run_ms << " ms, "
                  << "Avg: " << std::fixed << std::setprecision(1) << avg_ms << " ms/img, "
                  << std::setprecision(2) << ips << " img/s"
                  << ansi::reset << "\n\n";
        return failed;
    }
}
