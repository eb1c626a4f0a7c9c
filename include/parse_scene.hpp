#ifndef PARSE_SCENE_HPP
#define PARSE_SCENE_HPP
#include <istream>
#include <string>

#include "camera.hpp"
#include "world.hpp"

struct Scene {
    World world;
    Camera camera = Camera(160, 120, glm::radians(60.0));
    std::string output_filename = "render.png";
    // 0 leaves the scene graph as written
    std::size_t divide_threshold = 0;
};

Scene parse_scene(std::string filename);
// relative obj paths are resolved against base_dir
Scene parse_scene(std::istream &in, const std::string &base_dir, const std::string &name = "<stream>");
#endif
