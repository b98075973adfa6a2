#include "roix/app.hpp"
#include "roix/ansi.hpp"
#include "roix/errors.hpp"
#include "roix/export_record.hpp"
#include "roix/log.hpp"
#include "roix/progress.hpp"
#include "roix/ui.hpp"

#include <opencv2/imgcodecs.hpp>

#include <chrono>
#include <fstream>
#include <future>
#include <iostream>
#include <optional>
#include <stdexcept>

namespace fs = std::filesystem;

namespace roix::app
{
    namespace
    {
        bool require_image(const State &s)
        {
            if (s.hasImage)
                return true;
            std::cout << ansi::warn << "Load an image first (option 1)." << ansi::reset << "\n\n";
            ui::wait_for_enter();
            return false;
        }

        void save_preview(const State &s, const cv::Mat &preview, const std::string &tag)
        {
            if (!s.saveOutputs || preview.empty())
                return;
            const fs::path dir = progress::output_root() / "previews";
            std::error_code ec;
            fs::create_directories(dir, ec);
            const fs::path file = dir / (fs::path(s.imagePath).stem().string() + "_" + tag + "_" +
                                         progress::now_stamp() + ".png");
            if (cv::imwrite(file.string(), preview))
                std::cout << ansi::muted << "Preview: " << file.string() << ansi::reset << "\n";
            else
                log::w("failed to write " + file.string());
        }

        void accept(State &s, Region r)
        {
            const int idx = s.regions.add(std::move(r));
            s.regions.select(idx);
            const Region *added = s.regions.get(idx);
            std::cout << ansi::ok << "[OK] Added " << added->name() << " ["
                      << added->x() << "," << added->y() << " " << added->width() << "x" << added->height()
                      << "]" << ansi::reset << "\n";
        }

        // Runs fn and reports library errors without leaving the session.
        template <typename Fn>
        bool guarded(Fn &&fn)
        {
            try
            {
                fn();
                return true;
            }
            catch (const Error &ex)
            {
                std::cout << ansi::err << "[X] " << ex.what() << ansi::reset << "\n";
            }
            catch (const cv::Exception &ex)
            {
                std::cout << ansi::err << "[X] OpenCV: " << ex.what() << ansi::reset << "\n";
            }
            return false;
        }

        std::optional<double> parse_double(const std::string &s)
        {
            try
            {
                std::size_t used = 0;
                const double d = std::stod(s, &used);
                if (used == s.size())
                    return d;
            }
            catch (const std::logic_error &)
            {
            }
            return std::nullopt;
        }
    }

    Application::Application() : mergeTool_(engine_) { state_.debug = log::g_debug; }

    int Application::run() { return main_loop(); }

    int Application::main_loop()
    {
        for (;;)
        {
            ui::main_menu(state_);
            const int choice = ui::read_menu_choice();
            if (!std::cin.good())
                return 0;

            switch (choice)
            {
            case 1:
                ui::input(state_);
                break;
            case 2:
                ui::settings(state_);
                break;
            case 3:
                ui::help();
                break;
            case 4:
                ui::about();
                break;
            case 5:
                auto_detect();
                break;
            case 6:
                flood_at_point();
                break;
            case 7:
                cut_at_point();
                break;
            case 8:
                superpixel_session();
                break;
            case 9:
                regions_view();
                break;
            case 0:
                ansi::clear_screen();
                std::cout << ansi::muted << "Bye! " << ansi::reset << "\n";
                return 0;

            default:
                std::cout << ansi::warn << "Invalid choice." << ansi::reset << "\n";
            }
        }
    }

    void Application::auto_detect()
    {
        ui::title("Auto-detect");
        if (!require_image(state_))
            return;

        guarded([&]
                {
            const GeometricDetector detector(state_.detector);
            const auto t0 = std::chrono::steady_clock::now();
            std::vector<Region> found = detector.detect_all(state_.image);
            const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - t0)
                                .count();

            std::cout << ansi::bold << found.size() << " candidate(s)" << ansi::reset
                      << ansi::muted << " [" << ms << " ms]" << ansi::reset << "\n\n";
            ui::print_regions(found);
            save_preview(state_, GeometricDetector::draw_preview(state_.image, found), "detect");

            if (found.empty())
                return;
            const std::string answer = ui::trim(ui::read_line("\nAdd all to the collection? [Y/n] "));
            if (answer.empty() || answer == "y" || answer == "Y")
            {
                for (auto &r : found)
                    state_.regions.add(std::move(r));
                std::cout << ansi::ok << "[OK] Collection now holds " << state_.regions.size()
                          << " region(s)." << ansi::reset << "\n";
            } });
        std::cout << "\n";
        ui::wait_for_enter();
    }

    void Application::flood_at_point()
    {
        ui::title("Color flood");
        if (!require_image(state_))
            return;

        std::cout << "Tolerance: " << state_.flood.tolerance << " (Settings to change)\n";
        std::cout << ansi::muted << "Enter 'X Y' or 'X Y all' to merge every similar component."
                  << ansi::reset << "\n\n";
        auto tokens = ui::split(ui::read_line("Seed> "));
        const bool mergeAll = tokens.size() == 3 && tokens[2] == "all";
        if (mergeAll)
            tokens.pop_back();
        const auto seed = ui::parse_ints(tokens, 0, 2);
        if (!seed)
        {
            std::cout << ansi::warn << "Expected two integers." << ansi::reset << "\n\n";
            ui::wait_for_enter();
            return;
        }

        guarded([&]
                {
            const ColorFloodSegmenter flood(state_.flood);
            auto region = flood.detect_at_point(state_.image, (*seed)[0], (*seed)[1],
                                                state_.flood.tolerance, mergeAll);
            if (!region)
            {
                std::cout << ansi::warn << "No component large enough at that point." << ansi::reset << "\n";
                return;
            }
            save_preview(state_, GeometricDetector::draw_preview(state_.image, {*region}), "flood");
            accept(state_, std::move(*region)); });
        std::cout << "\n";
        ui::wait_for_enter();
    }

    void Application::cut_at_point()
    {
        ui::title("Graph cut");
        if (!require_image(state_))
            return;

        std::cout << "Expansion: " << state_.cut.expansion << " px (Settings to change)\n";
        std::cout << ansi::muted << "Enter 'X Y' or 'X Y refine' for a smoothed mask."
                  << ansi::reset << "\n\n";
        auto tokens = ui::split(ui::read_line("Seed> "));
        const bool refine = tokens.size() == 3 && tokens[2] == "refine";
        if (refine)
            tokens.pop_back();
        const auto seed = ui::parse_ints(tokens, 0, 2);
        if (!seed)
        {
            std::cout << ansi::warn << "Expected two integers." << ansi::reset << "\n\n";
            ui::wait_for_enter();
            return;
        }

        guarded([&]
                {
            const InteractiveCutSegmenter cut(state_.cut);
            const int x = (*seed)[0], y = (*seed)[1];
            auto res = refine ? cut.segment_with_refinement(state_.image, x, y)
                              : cut.segment_at_point(state_.image, x, y);
            if (!res)
            {
                std::cout << ansi::warn << "No foreground found around that point." << ansi::reset << "\n";
                return;
            }
            log::d("cut mask pixels: " + std::to_string(cv::countNonZero(res->mask)));
            save_preview(state_, GeometricDetector::draw_preview(state_.image, {res->region}), "cut");
            accept(state_, std::move(res->region)); });
        std::cout << "\n";
        ui::wait_for_enter();
    }

    void Application::superpixel_session()
    {
        ui::title("Superpixels");
        if (!require_image(state_))
            return;

        if (engine_.available_backends().empty())
        {
            std::cout << ansi::err << "[X] No superpixel backend available." << ansi::reset << "\n\n";
            ui::wait_for_enter();
            return;
        }

        std::cout << "Segmenting (size " << state_.superpixel.region_size << ", ruler "
                  << state_.superpixel.ruler << ")" << std::flush;
        try
        {
            auto pending = engine_.segment_async(state_.image, state_.superpixel);
            while (pending.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready)
                std::cout << "." << std::flush;
            engine_.install(pending.get());
        }
        catch (const Error &ex)
        {
            std::cout << "\n"
                      << ansi::err << "[X] " << ex.what() << ansi::reset << "\n\n";
            ui::wait_for_enter();
            return;
        }
        const auto res = engine_.result();
        std::cout << "\n"
                  << ansi::ok << res->regions.size() << " superpixels via " << res->backend
                  << ansi::reset << "\n";
        save_preview(state_, engine_.draw_boundaries(state_.image), "superpixels");
        std::cout << ansi::muted << "Commands: c X Y | a X Y | r X1 Y1 X2 Y2 | m | auto [MIN THR] | x | q"
                  << ansi::reset << "\n\n";

        for (;;)
        {
            const auto tokens = ui::split(ui::read_line("sp> "));
            if (!std::cin.good() || tokens.empty())
            {
                if (!std::cin.good())
                    break;
                continue;
            }
            const std::string &cmd = tokens[0];
            if (cmd == "q")
                break;

            guarded([&]
                    {
                if (cmd == "c" || cmd == "a")
                {
                    const auto v = ui::parse_ints(tokens, 1, 2);
                    if (!v)
                        throw InputError("usage: " + cmd + " X Y");
                    const SuperpixelRegion *hit = mergeTool_.click_select((*v)[0], (*v)[1], cmd == "a");
                    if (hit)
                        std::cout << "label " << hit->label << " (area " << hit->area << ")";
                    else
                        std::cout << "nothing there";
                    std::cout << ansi::muted << "  selected: " << mergeTool_.selection().size()
                              << ansi::reset << "\n";
                }
                else if (cmd == "r")
                {
                    const auto v = ui::parse_ints(tokens, 1, 4);
                    if (!v)
                        throw InputError("usage: r X1 Y1 X2 Y2");
                    const auto added = mergeTool_.rect_select((*v)[0], (*v)[1], (*v)[2], (*v)[3]);
                    std::cout << added.size() << " under rectangle" << ansi::muted << "  selected: "
                              << mergeTool_.selection().size() << ansi::reset << "\n";
                }
                else if (cmd == "m")
                {
                    auto merged = mergeTool_.merge_selected();
                    if (!merged)
                        std::cout << ansi::warn << "Select at least two superpixels." << ansi::reset << "\n";
                    else
                        std::cout << ansi::ok << "merged into " << merged->name() << " ["
                                  << merged->width() << "x" << merged->height() << "]" << ansi::reset << "\n";
                }
                else if (cmd == "auto")
                {
                    double minArea = state_.autoMergeMinArea, thr = state_.autoMergeColor;
                    if (tokens.size() == 3)
                    {
                        const auto a = parse_double(tokens[1]), t = parse_double(tokens[2]);
                        if (!a || !t)
                            throw InputError("usage: auto [MIN THR]");
                        minArea = *a;
                        thr = *t;
                    }
                    else if (tokens.size() != 1)
                        throw InputError("usage: auto [MIN THR]");
                    const auto made = mergeTool_.auto_merge_all(minArea, thr);
                    std::cout << ansi::ok << made.size() << " merged region(s)" << ansi::reset << "\n";
                }
                else if (cmd == "x")
                {
                    mergeTool_.clear_selection();
                    std::cout << "selection cleared\n";
                }
                else
                {
                    std::cout << ansi::warn << "Unknown command '" << cmd << "'." << ansi::reset << "\n";
                } });
        }

        std::vector<Region> merged = mergeTool_.finalize();
        for (auto &r : merged)
            state_.regions.add(std::move(r));
        std::cout << ansi::ok << "[OK] " << merged.size() << " merged region(s) added." << ansi::reset << "\n\n";
        ui::wait_for_enter();
    }

    void Application::regions_view()
    {
        for (;;)
        {
            ui::title("Regions");
            ui::print_regions(state_.regions.regions(), state_.regions.selected_index());
            std::cout << "\n"
                      << ansi::muted
                      << "Commands: s N | d N | c N | mv N DX DY | rs N H X Y | name N NEW | save FILE | load FILE | crops | b\n"
                      << "Resize handles: 0 TL, 1 T, 2 TR, 3 L, 4 R, 5 BL, 6 B, 7 BR"
                      << ansi::reset << "\n";
            const auto tokens = ui::split(ui::read_line("roi> "));
            if (!std::cin.good() || (!tokens.empty() && tokens[0] == "b"))
                return;
            if (tokens.empty())
                continue;
            const std::string &cmd = tokens[0];

            const bool ok = guarded([&]
                                    {
                if (cmd == "s" || cmd == "d" || cmd == "c")
                {
                    const auto v = ui::parse_ints(tokens, 1, 1);
                    if (!v || !state_.regions.get((*v)[0]))
                        throw InputError("no region with that index");
                    state_.regions.select((*v)[0]);
                    if (cmd == "d")
                        state_.regions.remove_selected();
                    else if (cmd == "c")
                        state_.regions.copy_selected();
                }
                else if (cmd == "mv")
                {
                    const auto v = ui::parse_ints(tokens, 1, 3);
                    if (!v || !state_.regions.move((*v)[0], (*v)[1], (*v)[2]))
                        throw InputError("usage: mv N DX DY");
                }
                else if (cmd == "rs")
                {
                    const auto v = ui::parse_ints(tokens, 1, 4);
                    if (!v || !state_.regions.resize((*v)[0], (*v)[1], {(*v)[2], (*v)[3]}))
                        throw InputError("usage: rs N H X Y");
                }
                else if (cmd == "name" && tokens.size() == 3)
                {
                    const auto v = ui::parse_ints(tokens, 1, 1);
                    Region *r = v ? state_.regions.get((*v)[0]) : nullptr;
                    if (!r)
                        throw InputError("no region with that index");
                    if (state_.regions.contains_name(tokens[2]))
                        throw InputError("name already used: " + tokens[2]);
                    r->set_name(tokens[2]);
                }
                else if (cmd == "save" && tokens.size() == 2)
                {
                    std::ofstream out(tokens[1]);
                    if (!out)
                        throw InputError("cannot write " + tokens[1]);
                    out << to_document(state_.regions).dump(2) << "\n";
                    std::cout << ansi::ok << "[OK] Saved " << state_.regions.size() << " region(s)."
                              << ansi::reset << "\n";
                    ui::wait_for_enter();
                }
                else if (cmd == "load" && tokens.size() == 2)
                {
                    std::ifstream in(tokens[1]);
                    if (!in)
                        throw InputError("cannot read " + tokens[1]);
                    nlohmann::json doc;
                    try
                    {
                        in >> doc;
                    }
                    catch (const nlohmann::json::parse_error &ex)
                    {
                        throw InputError(std::string("invalid JSON: ") + ex.what());
                    }
                    load_document(doc, state_.regions);
                }
                else if (cmd == "crops")
                {
                    if (!state_.hasImage)
                        throw InputError("no image loaded");
                    const fs::path dir = progress::output_root() / "crops" / progress::now_stamp();
                    const int n = progress::save_crops(state_.image, state_.regions.regions(), dir);
                    std::cout << ansi::ok << "[OK] " << n << " crop(s) in " << dir.string() << ansi::reset << "\n";
                    ui::wait_for_enter();
                }
                else
                {
                    std::cout << ansi::warn << "Unknown command." << ansi::reset << "\n";
                    ui::wait_for_enter();
                } });
            if (!ok)
                ui::wait_for_enter();
        }
    }
}
