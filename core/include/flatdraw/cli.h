// flatdraw Viewer CLI
// Handles: flatdraw-viewer [--scene file] [--window WxH] [--frames N] [--snapshot out.png]

#pragma once

#include <string>

namespace flatdraw::cli {

// Version info
constexpr const char* VERSION = "1.0.0";

struct ViewerOptions {
    std::string scenePath;     // Empty = built-in demo scene
    int windowWidth = 1280;
    int windowHeight = 720;
    int maxFrames = 0;         // 0 = run until the window closes
    std::string snapshotPath;  // Software render one frame to PNG and exit
};

// Parse viewer arguments into options
// Returns: 0+ = handled (exit with this code), -1 = continue to the viewer
int parseArgs(int argc, char** argv, ViewerOptions& options);

// Parse "WxH"; false when either side is missing or not positive
bool parseSize(const std::string& text, int& width, int& height);

} // namespace flatdraw::cli
