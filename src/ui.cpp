#include "roix/ui.hpp"
#include "roix/app.hpp"
#include "roix/ansi.hpp"
#include "roix/log.hpp"

#include <opencv2/imgcodecs.hpp>

#include <cctype>
#include <cstdlib> // std::getenv
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

namespace roix::app::ui
{
    static const char *kMenu = R"MENU(
Choose an option:

  1) Input: Load screenshot
  2) Settings: Debug, outputs, parameters
  3) Help: How to use
  4) About
  5) Auto-detect: Circles, red dots, buttons, icons
  6) Color flood at point
  7) Graph cut at point
  8) Superpixels: Select & merge
  9) Regions: List, edit, export
  0) Exit
)MENU";

    std::string trim(std::string s)
    {
        const auto sp = [](unsigned char c)
        { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
        std::size_t a = 0;
        while (a < s.size() && sp((unsigned char)s[a]))
            ++a;
        std::size_t b = s.size();
        while (b > a && sp((unsigned char)s[b - 1]))
            --b;
        return s.substr(a, b - a);
    }

    std::string read_line(const std::string &prompt)
    {
        std::cout << ansi::info << prompt << ansi::reset;
        std::string s;
        std::getline(std::cin, s);
        return s;
    }

    std::vector<std::string> split(const std::string &line)
    {
        std::istringstream iss(line);
        std::vector<std::string> out;
        std::string tok;
        while (iss >> tok)
            out.push_back(tok);
        return out;
    }

    std::optional<std::vector<int>> parse_ints(const std::vector<std::string> &tokens, std::size_t first, std::size_t n)
    {
        if (tokens.size() != first + n)
            return std::nullopt;
        std::vector<int> out;
        for (std::size_t k = first; k < tokens.size(); ++k)
        {
            try
            {
                std::size_t used = 0;
                const int v = std::stoi(tokens[k], &used);
                if (used != tokens[k].size())
                    return std::nullopt;
                out.push_back(v);
            }
            catch (const std::logic_error &)
            {
                return std::nullopt;
            }
        }
        return out;
    }

    std::optional<std::vector<int>> read_ints(const std::string &prompt, std::size_t n)
    {
        return parse_ints(split(read_line(prompt)), 0, n);
    }

    // Map "C:\Users\..." -> "/host/c/Users/..." if ROIX_HOST_ROOT is set
    std::string map_host_path_if_needed(const std::string &in)
    {
        const char *root = std::getenv("ROIX_HOST_ROOT"); // e.g. "/host"
        if (!root || !*root)
            return in;

        static const std::regex winDrive(R"(^([A-Za-z]):[\\/](.*))");
        std::smatch m;
        if (std::regex_match(in, m, winDrive) && m.size() == 3)
        {
            std::string drive = m[1].str();
            std::string rest = m[2].str();
            for (auto &ch : rest)
                if (ch == '\\')
                    ch = '/';
            const char lower = (char)std::tolower((unsigned char)drive[0]);
            return std::string(root) + "/" + lower + "/" + rest;
        }
        return in;
    }

    void title(const std::string &t)
    {
        ansi::clear_screen();
        std::cout << ansi::title << ansi::bold << t << ansi::reset << "\n";
        std::cout << ansi::muted << std::string(t.size(), '=') << ansi::reset << "\n\n";
    }

    void main_menu(const app::State &s)
    {
        title("ROIX Region Extractor (TUI)");
        std::cout << kMenu << "\n";
        std::cout << ansi::muted << "Image: ";
        if (s.hasImage)
            std::cout << s.imagePath << " (" << s.image.cols << "x" << s.image.rows << ")";
        else
            std::cout << "(none)";
        std::cout << ", Regions: " << s.regions.size() << ansi::reset << "\n";
        std::cout << ansi::muted
                  << "Debug: " << (s.debug ? "ON" : "OFF")
                  << ", Save outputs: " << (s.saveOutputs ? "ON" : "OFF")
                  << ansi::reset << "\n\n";
    }

    void help()
    {
        title("Help");
        std::cout
            << "- Load a PNG/JPEG screenshot (option 1).\n"
            << "- Auto-detect (5) adds circle, red dot, button and icon candidates.\n"
            << "- Flood (6) and cut (7) take a seed point 'X Y' in image pixels.\n"
            << "- Superpixels (8) opens a sub-session:\n"
            << "    c X Y            select the superpixel under the point\n"
            << "    a X Y            toggle it in the selection\n"
            << "    r X1 Y1 X2 Y2    add every superpixel under the rectangle\n"
            << "    m                merge the selection into one region\n"
            << "    auto [MIN THR]   merge small neighbours of similar color\n"
            << "    x                clear the selection\n"
            << "    q                keep merged regions and leave\n"
            << "- Regions (9) lists, deletes, copies, moves and exports the collection.\n"
            << "- Outputs go to $ROIX_OUTPUT_ROOT (default ./roix_output).\n\n";
        wait_for_enter();
    }

    void about()
    {
        title("About");
        std::cout
            << "Interactive region-of-interest extraction for UI screenshots.\n"
            << "Uses OpenCV for shape detection, color flood, GrabCut and superpixels.\n\n";
        wait_for_enter();
    }

    void wait_for_enter(const std::string &prompt)
    {
        std::cout << ansi::muted << prompt << ansi::reset;
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    }

    int read_menu_choice()
    {
        std::cout << "Select (0-9): ";
        std::string line;
        std::getline(std::cin, line);
        const auto v = parse_ints(split(line), 0, 1);
        return v ? (*v)[0] : -1;
    }

    bool load_image(app::State &s, const std::string &pathStr)
    {
        const std::string mapped = map_host_path_if_needed(trim(pathStr));
        const fs::path p = mapped;

        if (p.empty() || !fs::is_regular_file(p))
            return false;

        cv::Mat img = cv::imread(p.string(), cv::IMREAD_COLOR);
        if (img.empty())
            return false;

        s.imagePath = fs::absolute(p).string();
        s.image = img;
        s.hasImage = true;
        log::d("loaded " + s.imagePath + " " + std::to_string(img.cols) + "x" + std::to_string(img.rows));
        return true;
    }

    void input(app::State &s)
    {
        title("Input");
        std::cout << "Provide a path to a screenshot (PNG/JPEG).\n\n";
        std::cout << ansi::muted
                  << "Examples:\n"
                     "  C:\\Users\\You\\Pictures\\screen.png\n"
                     "  /home/you/captures/home.png\n"
                     "  /host/c/Users/You/Pictures/screen.png   (with ROIX_HOST_ROOT=/host)\n"
                  << ansi::reset << "\n";

        const std::string path = read_line("Path> ");
        if (!std::cin.good())
            return;

        if (load_image(s, path))
        {
            std::cout << ansi::ok << "[OK] Loaded: " << s.imagePath
                      << " (" << s.image.cols << "x" << s.image.rows << ")" << ansi::reset << "\n";
            if (!s.regions.empty())
                std::cout << ansi::warn << "Existing regions kept (" << s.regions.size() << ")."
                          << ansi::reset << "\n";
        }
        else
        {
            std::cout << ansi::err << "[X] Not a readable image. Please try again." << ansi::reset << "\n";
        }
        std::cout << "\n";
        wait_for_enter();
    }

    void settings(app::State &s)
    {
        for (;;)
        {
            title("Settings");
            std::cout
                << "Toggle options / edit values (type number):\n"
                << "  1) Debug logs: " << (s.debug ? "ON" : "OFF") << "\n"
                << "  2) Save outputs (previews, crops): " << (s.saveOutputs ? "ON" : "OFF") << "\n"
                << "  3) Flood tolerance: " << s.flood.tolerance << "\n"
                << "  4) Cut expansion / refine expansion: " << s.cut.expansion << " / " << s.cut.refine_expansion
                << "\n"
                << "  5) Superpixel size / ruler: " << s.superpixel.region_size << " / " << s.superpixel.ruler << "\n"
                << "  6) Auto-merge min area / color threshold: " << s.autoMergeMinArea << " / "
                << s.autoMergeColor << "\n"
                << "  7) Merge IoU threshold: " << s.detector.merge_iou << "\n"
                << "  0) Back\n\n";
            std::cout << "Select: ";
            std::string line;
            std::getline(std::cin, line);
            line = trim(line);
            if (!std::cin.good() || line == "0" || line.empty())
                return;

            auto read_double = [](const std::string &prompt, double &dst)
            {
                const std::string v = trim(read_line(prompt));
                try
                {
                    std::size_t used = 0;
                    const double d = std::stod(v, &used);
                    if (used == v.size())
                        dst = d;
                }
                catch (const std::logic_error &)
                {
                    std::cout << ansi::warn << "Not a number, kept." << ansi::reset << "\n";
                }
            };

            if (line == "1")
            {
                s.debug = !s.debug;
                log::set(s.debug);
            }
            else if (line == "2")
                s.saveOutputs = !s.saveOutputs;
            else if (line == "3")
                read_double("Tolerance (>= 0)> ", s.flood.tolerance);
            else if (line == "4")
            {
                if (auto v = read_ints("Expansion (px)> ", 1); v && (*v)[0] > 0)
                    s.cut.expansion = (*v)[0];
                if (auto v = read_ints("Refine expansion (px)> ", 1); v && (*v)[0] > 0)
                    s.cut.refine_expansion = (*v)[0];
            }
            else if (line == "5")
            {
                if (auto v = read_ints("Region size> ", 1); v && (*v)[0] >= 2)
                    s.superpixel.region_size = (*v)[0];
                double ruler = s.superpixel.ruler;
                read_double("Ruler> ", ruler);
                if (ruler > 0.0)
                    s.superpixel.ruler = static_cast<float>(ruler);
            }
            else if (line == "6")
            {
                read_double("Min area> ", s.autoMergeMinArea);
                read_double("Color threshold> ", s.autoMergeColor);
            }
            else if (line == "7")
            {
                double iou = s.detector.merge_iou;
                read_double("IoU threshold (0..1)> ", iou);
                if (iou >= 0.0 && iou <= 1.0)
                    s.detector.merge_iou = iou;
            }
        }
    }

    void print_regions(const std::vector<Region> &regions, int selected)
    {
        if (regions.empty())
        {
            std::cout << ansi::muted << "(no regions)" << ansi::reset << "\n";
            return;
        }
        for (std::size_t k = 0; k < regions.size(); ++k)
        {
            const Region &r = regions[k];
            const char *kind = r.is_circle() ? "circle" : r.is_freeform() ? "freeform" : "rect";
            std::cout << ((int)k == selected ? ansi::ok : "") << std::setw(3) << k << ") "
                      << std::left << std::setw(20) << r.name() << std::right
                      << ansi::muted << " " << std::setw(8) << kind << "  "
                      << "[" << r.x() << "," << r.y() << " " << r.width() << "x" << r.height() << "]"
                      << "  area=" << std::fixed << std::setprecision(0) << r.area()
                      << (r.segmented() ? "  seg" : "") << ansi::reset << "\n";
        }
    }

    std::vector<std::string> collect_images(const std::string &path)
    {
        std::vector<std::string> out;
        const fs::path p = map_host_path_if_needed(trim(path));
        std::error_code ec;
        if (!fs::is_directory(p, ec))
        {
            if (fs::is_regular_file(p, ec))
                out.push_back(p.string());
            return out;
        }
        for (auto &e : fs::recursive_directory_iterator(p, ec))
        {
            if (!e.is_regular_file())
                continue;
            auto ext = e.path().extension().string();
            for (auto &c : ext)
                c = (char)std::tolower((unsigned char)c);
            if (ext == ".png" || ext == ".jpg" || ext == ".jpeg")
                out.push_back(e.path().string());
        }
        return out;
    }
}
