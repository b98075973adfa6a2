#include "roix/color_flood.hpp"
#include "roix/errors.hpp"
#include "roix/export_record.hpp"
#include "roix/geometric_detector.hpp"
#include "roix/interactive_cut.hpp"
#include "roix/log.hpp"
#include "roix/merge_tool.hpp"
#include "roix/progress.hpp"
#include "roix/superpixel.hpp"
#include "roix/ui.hpp"

#include <opencv2/imgcodecs.hpp>

#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace
{
    const char *kUsage =
        "Usage: roix_cli [--debug] [--json FILE] [--crops DIR] [--preview FILE] COMMAND ARGS\n"
        "\n"
        "Commands:\n"
        "  detect IMG                              all geometric detectors, deduplicated\n"
        "  circles IMG [--min-radius R] [--max-radius R]\n"
        "  red-dots IMG\n"
        "  buttons IMG\n"
        "  icons IMG\n"
        "  flood X Y IMG [--tolerance T] [--merge-all]\n"
        "  cut X Y IMG [--expansion E] [--refine]\n"
        "  superpixels IMG [--size S] [--ruler R] [--min-area A]\n"
        "              [--select X1 Y1 X2 Y2] [--auto-merge MIN THR]\n"
        "  batch PATH [PATH...] [--save]        auto-detect report under $ROIX_OUTPUT_ROOT\n"
        "\n"
        "Exit status: 0 regions found, 2 nothing found, 1 error.\n";

    // Options that take values, and how many.
    const std::map<std::string, int> kValued = {
        {"--json", 1}, {"--crops", 1}, {"--preview", 1}, {"--tolerance", 1}, {"--expansion", 1},
        {"--size", 1}, {"--ruler", 1}, {"--min-area", 1}, {"--min-radius", 1}, {"--max-radius", 1},
        {"--select", 4}, {"--auto-merge", 2}};

    struct Args
    {
        std::vector<std::string> positional;
        std::map<std::string, std::vector<std::string>> options;
        bool debug{false}, mergeAll{false}, refine{false}, save{false};

        bool has(const std::string &k) const { return options.count(k) > 0; }

        double num(const std::string &k, double def, std::size_t i = 0) const
        {
            auto it = options.find(k);
            if (it == options.end())
                return def;
            try
            {
                std::size_t used = 0;
                const double v = std::stod(it->second[i], &used);
                if (used == it->second[i].size())
                    return v;
            }
            catch (const std::logic_error &)
            {
            }
            throw roix::InputError(k + " expects a number, got '" + it->second[i] + "'");
        }

        int integer(const std::string &k, int def, std::size_t i = 0) const
        {
            const double v = num(k, def, i);
            if (v != (double)(int)v)
                throw roix::InputError(k + " expects an integer");
            return (int)v;
        }

        std::string str(const std::string &k) const
        {
            auto it = options.find(k);
            return it == options.end() ? std::string{} : it->second[0];
        }
    };

    std::optional<Args> parse_args(int argc, char **argv)
    {
        Args a;
        for (int i = 1; i < argc; i++)
        {
            const std::string s = argv[i];
            if (s == "--debug")
                a.debug = true;
            else if (s == "--merge-all")
                a.mergeAll = true;
            else if (s == "--refine")
                a.refine = true;
            else if (s == "--save")
                a.save = true;
            else if (kValued.count(s))
            {
                const int n = kValued.at(s);
                if (i + n >= argc)
                {
                    std::cerr << s << " needs " << n << " value(s)\n";
                    return std::nullopt;
                }
                std::vector<std::string> vals(argv + i + 1, argv + i + 1 + n);
                a.options[s] = std::move(vals);
                i += n;
            }
            else if (s.size() > 2 && s.compare(0, 2, "--") == 0)
            {
                std::cerr << "Unknown option " << s << "\n";
                return std::nullopt;
            }
            else
                a.positional.push_back(s);
        }
        return a;
    }

    cv::Mat load(const std::string &path)
    {
        cv::Mat img = cv::imread(path, cv::IMREAD_COLOR);
        if (img.empty())
            throw roix::InputError("failed to read image " + path);
        return img;
    }

    int to_int(const std::string &s)
    {
        const auto v = roix::app::ui::parse_ints({s}, 0, 1);
        if (!v)
            throw roix::InputError("expected an integer, got '" + s + "'");
        return (*v)[0];
    }

    std::vector<roix::Region> run_superpixels(const cv::Mat &img, const Args &a)
    {
        roix::SuperpixelParams params;
        params.region_size = a.integer("--size", params.region_size);
        params.ruler = (float)a.num("--ruler", params.ruler);

        roix::SuperpixelEngine engine;
        const auto res = engine.segment(img, params);
        roix::log::i(std::to_string(res->regions.size()) + " superpixels via " + res->backend);

        roix::SuperpixelMergeTool tool(engine);
        if (a.has("--select"))
        {
            tool.rect_select(a.integer("--select", 0, 0), a.integer("--select", 0, 1),
                             a.integer("--select", 0, 2), a.integer("--select", 0, 3));
            if (!tool.merge_selected())
                roix::log::w("selection covers fewer than two superpixels");
        }
        if (a.has("--auto-merge"))
            tool.auto_merge_all(a.num("--auto-merge", 500.0, 0), a.num("--auto-merge", 30.0, 1));
        if (a.has("--select") || a.has("--auto-merge"))
            return tool.finalize();

        std::vector<roix::Region> out;
        for (const auto *sp : engine.filter_regions(a.num("--min-area", 100.0)))
            if (auto r = engine.merge_regions({sp}))
                out.push_back(std::move(*r));
        return out;
    }

    std::vector<roix::Region> run(const std::string &cmd, const Args &a, cv::Mat &img)
    {
        const auto &p = a.positional;
        const roix::GeometricDetector detector{};

        if (cmd == "flood" || cmd == "cut")
        {
            if (p.size() != 4)
                throw roix::InputError(cmd + " expects X Y IMG");
            const int x = to_int(p[1]), y = to_int(p[2]);
            img = load(p[3]);
            if (cmd == "flood")
            {
                const roix::ColorFloodSegmenter flood{};
                auto r = flood.detect_at_point(img, x, y, a.num("--tolerance", flood.params().tolerance), a.mergeAll);
                return r ? std::vector<roix::Region>{std::move(*r)} : std::vector<roix::Region>{};
            }
            const roix::InteractiveCutSegmenter cut{};
            const int expansion = a.integer("--expansion", a.refine ? cut.params().refine_expansion
                                                                    : cut.params().expansion);
            auto r = a.refine ? cut.segment_with_refinement(img, x, y, expansion)
                              : cut.segment_at_point(img, x, y, expansion);
            return r ? std::vector<roix::Region>{std::move(r->region)} : std::vector<roix::Region>{};
        }

        if (p.size() != 2)
            throw roix::InputError(cmd + " expects IMG");
        img = load(p[1]);

        if (cmd == "detect")
            return detector.detect_all(img);
        if (cmd == "circles")
            return detector.detect_circles(img, a.integer("--min-radius", detector.params().circle_min_radius),
                                           a.integer("--max-radius", detector.params().circle_max_radius));
        if (cmd == "red-dots")
            return detector.detect_red_dots(img);
        if (cmd == "buttons")
            return detector.detect_ui_buttons(img);
        if (cmd == "icons")
            return detector.detect_icons(img);
        if (cmd == "superpixels")
            return run_superpixels(img, a);
        throw roix::InputError("unknown command '" + cmd + "'");
    }

    void write_outputs(const Args &a, const cv::Mat &img, const std::vector<roix::Region> &regions)
    {
        if (a.has("--json"))
        {
            roix::RegionCollection coll;
            for (const auto &r : regions)
                coll.add(r);
            std::ofstream out(a.str("--json"));
            if (!out)
                throw roix::InputError("cannot write " + a.str("--json"));
            out << roix::to_document(coll).dump(2) << "\n";
        }
        if (a.has("--crops"))
        {
            const int n = roix::app::progress::save_crops(img, regions, a.str("--crops"));
            roix::log::i(std::to_string(n) + " crop(s) written to " + a.str("--crops"));
        }
        if (a.has("--preview") && !cv::imwrite(a.str("--preview"), roix::GeometricDetector::draw_preview(img, regions)))
            roix::log::w("failed to write " + a.str("--preview"));
    }
}

int main(int argc, char **argv)
{
    roix::log::init_from_env();
    const auto args = parse_args(argc, argv);
    if (!args || args->positional.empty())
    {
        std::cerr << kUsage;
        return 1;
    }
    if (args->debug)
        roix::log::set(true);

    const std::string &cmd = args->positional[0];
    if (cmd == "batch")
    {
        std::vector<std::string> images;
        for (std::size_t i = 1; i < args->positional.size(); ++i)
            for (auto &f : roix::app::ui::collect_images(args->positional[i]))
                images.push_back(f);
        if (images.empty())
        {
            std::cerr << "No images found.\n";
            return 1;
        }
        roix::app::progress::BatchOptions opts;
        opts.debug = roix::log::g_debug;
        opts.saveOutputs = args->save;
        return roix::app::progress::process_and_report(images, opts) > 0 ? 1 : 0;
    }

    try
    {
        cv::Mat img;
        const std::vector<roix::Region> regions = run(cmd, *args, img);
        for (const auto &r : regions)
            std::cout << r.name() << " " << r.x() << " " << r.y() << " " << r.width() << " " << r.height() << "\n";
        write_outputs(*args, img, regions);
        return regions.empty() ? 2 : 0;
    }
    catch (const roix::InputError &ex)
    {
        std::cerr << ex.what() << "\n\n"
                  << kUsage;
        return 1;
    }
    catch (const roix::Error &ex)
    {
        std::cerr << "Failed: " << ex.what() << "\n";
        return 1;
    }
    catch (const cv::Exception &ex)
    {
        std::cerr << "OpenCV: " << ex.what() << "\n";
        return 1;
    }
}
