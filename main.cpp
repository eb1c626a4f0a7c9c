// run  := ./whitted scenes/glass.scene && open glass.png
#include <iostream>
#include <stdexcept>

#include "image.hpp"
#include "parse_scene.hpp"
#include "ray_tracer.hpp"

namespace {
bool ends_with(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}
}

int32_t main(int32_t argc, char **argv) {
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <scene_file>" << std::endl;
        return 1;
    }
    try {
        Scene scene = parse_scene(argv[1]);
        if (scene.divide_threshold > 0) scene.world.divide(scene.divide_threshold);
        Image img = raytracer::run(scene.world, scene.camera, true);
        bool written = ends_with(scene.output_filename, ".ppm") ? img.dumpppm(scene.output_filename) : img.dumppng(scene.output_filename);
        if (!written) return 1;
        std::cout << "wrote " << scene.output_filename << std::endl;
    }
    catch (const std::exception &e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
