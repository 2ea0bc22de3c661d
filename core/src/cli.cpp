// flatdraw Viewer CLI Implementation

#include <flatdraw/cli.h>
#include <CLI/CLI.hpp>
#include <iostream>

namespace flatdraw::cli {

bool parseSize(const std::string& text, int& width, int& height) {
    size_t x = text.find('x');
    if (x == std::string::npos || x == 0 || x + 1 >= text.size()) {
        return false;
    }

    int w = 0;
    int h = 0;
    try {
        size_t used = 0;
        w = std::stoi(text.substr(0, x), &used);
        if (used != x) return false;
        std::string rest = text.substr(x + 1);
        h = std::stoi(rest, &used);
        if (used != rest.size()) return false;
    } catch (const std::exception&) {
        return false;
    }

    if (w <= 0 || h <= 0) {
        return false;
    }
    width = w;
    height = h;
    return true;
}

int parseArgs(int argc, char** argv, ViewerOptions& options) {
    CLI::App app{"flatdraw - instanced rectangle and circle viewer"};
    app.set_version_flag("-v,--version", std::string(VERSION));
    app.set_help_flag("-h,--help", "Show this help");

    std::string windowSize;
    app.add_option("-s,--scene", options.scenePath, "Scene JSON file (default: built-in demo)")
       ->check(CLI::ExistingFile);
    app.add_option("-w,--window", windowSize, "Window size as WxH (default 1280x720)");
    app.add_option("-f,--frames", options.maxFrames, "Exit after N frames (0 = run until closed)")
       ->check(CLI::NonNegativeNumber);
    app.add_option("--snapshot", options.snapshotPath,
                   "Software-render one frame to a PNG and exit");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    if (!windowSize.empty() &&
        !parseSize(windowSize, options.windowWidth, options.windowHeight)) {
        std::cerr << "Invalid --window size '" << windowSize << "', expected WxH\n";
        return 1;
    }

    return -1;
}

} // namespace flatdraw::cli
