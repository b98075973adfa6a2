#pragma once
#include "roix/region.hpp"

#include <optional>
#include <string>
#include <vector>

namespace roix::app
{
    struct State;
}

namespace roix::app::ui
{
    // ---- High-level UI ----
    void title(const std::string &t);
    void main_menu(const app::State &s);
    void help();
    void about();

    void wait_for_enter(const std::string &prompt = "Press Enter to continue...");

    // Returns -1 for anything that is not a plain integer.
    int read_menu_choice();

    // ---- Input & validation ----
    std::string trim(std::string s);
    std::string read_line(const std::string &prompt);

    // Whitespace separated tokens of a command line.
    std::vector<std::string> split(const std::string &line);

    // Exactly n integers, or nullopt.
    std::optional<std::vector<int>> parse_ints(const std::vector<std::string> &tokens, std::size_t first, std::size_t n);
    std::optional<std::vector<int>> read_ints(const std::string &prompt, std::size_t n);

    // Map "C:\..." -> "/host/c/..." when ROIX_HOST_ROOT is set (container drive mount)
    std::string map_host_path_if_needed(const std::string &p);

    // Loads the image into the state; false leaves the previous image in place.
    bool load_image(app::State &s, const std::string &pathStr);

    // Open the "Input" view to pick an image
    void input(app::State &s);

    // Toggle flags and edit strategy parameters
    void settings(app::State &s);

    // One line per region: index, name, shape, bbox, area.
    void print_regions(const std::vector<Region> &regions, int selected = -1);

    // Collect .png/.jpg/.jpeg files from a file or directory path
    std::vector<std::string> collect_images(const std::string &path);
}
