// flatdraw - Viewer entry point
// Scene loading, headless snapshot, interactive window

#include <flatdraw/cli.h>
#include <flatdraw/raster.h>
#include <flatdraw/scene.h>
#include <flatdraw/view.h>
#include "viewer.h"

#include <exception>
#include <iostream>
#include <string>
#include <utility>

using namespace flatdraw;

int main(int argc, char** argv) {
    cli::ViewerOptions options;
    int cliResult = cli::parseArgs(argc, argv, options);
    if (cliResult >= 0) {
        return cliResult;  // --help, --version or a bad argument
    }

    Scene scene;
    try {
        scene = options.scenePath.empty() ? defaultScene() : loadScene(options.scenePath);
    } catch (const SceneError& e) {
        std::cerr << "[Scene] " << e.what() << std::endl;
        return 1;
    }

    // Software render a single frame, no GPU involved
    if (!options.snapshotPath.empty()) {
        float aspect = aspectRatio(glm::vec2(options.windowWidth, options.windowHeight));
        bool written = renderSnapshot(options.snapshotPath, options.windowWidth, options.windowHeight,
                                      scene.camera.uniform(aspect), scene.clearColor,
                                      scene.circles, scene.rectangles);
        return written ? 0 : 1;
    }

    std::cout << "flatdraw - Starting..." << std::endl;

    try {
        Viewer viewer(std::move(scene), options.windowWidth, options.windowHeight, "flatdraw");
        return viewer.run(options.maxFrames);
    } catch (const std::exception& e) {
        std::cerr << "[Viewer] " << e.what() << std::endl;
        return 1;
    }
}
