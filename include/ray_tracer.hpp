#ifndef RAY_TRACER_HPP
#define RAY_TRACER_HPP

#include <vector>

#include "camera.hpp"
#include "image.hpp"
#include "world.hpp"

namespace raytracer {
// average color of the camera's antialiasing rays through pixel (x, y)
glm::dvec3 pixel_color(const World &world, const Camera &camera, unsigned x, unsigned y);
// rows [start, end), row-major
std::vector<glm::dvec3> render_segment(const World &world, const Camera &camera, unsigned start, unsigned end);
Image run(const World &world, const Camera &camera, bool show_progress);
}

#endif
