#ifndef CAMERA_HPP
#define CAMERA_HPP

#include <utility>
#include <vector>

#include "world.hpp"

// samples per pixel
enum class AASamples : unsigned { X1 = 1, X2 = 2, X4 = 4, X8 = 8, X16 = 16 };

AASamples aa_samples_from_count(unsigned count);
// sub-pixel offsets in [0, 1) for the given sample count
const std::vector<std::pair<double, double>> &sample_offsets(AASamples samples);

struct RenderOptions {
    unsigned num_threads = 1;
    AASamples aa_samples = AASamples::X1;
    unsigned max_depth = MAX_RECURSION_DEPTH;
};

struct Camera {
    unsigned hsize, vsize;
    double field_of_view;
    glm::dmat4 transform = glm::dmat4(1.0);
    glm::dmat4 inverse = glm::dmat4(1.0);
    double pixel_size, half_width, half_height;
    RenderOptions options;

    Camera(unsigned hsize, unsigned vsize, double field_of_view);
    void set_transform(const glm::dmat4 &m);
    void set_num_threads(unsigned n);
    Ray ray_for_pixel(unsigned px, unsigned py) const;
    Ray ray_for_pixel(unsigned px, unsigned py, double xoffset, double yoffset) const;
    std::vector<Ray> rays_for_pixel(unsigned px, unsigned py) const;
};

#endif
