#include <cmath>
#include <stdexcept>
#include <string>

#include "camera.hpp"

AASamples aa_samples_from_count(unsigned count) {
    switch (count) {
    case 1: return AASamples::X1;
    case 2: return AASamples::X2;
    case 4: return AASamples::X4;
    case 8: return AASamples::X8;
    case 16: return AASamples::X16;
    }
    throw std::invalid_argument("unsupported antialiasing sample count: " + std::to_string(count));
}

const std::vector<std::pair<double, double>> &sample_offsets(AASamples samples) {
    static const std::vector<std::pair<double, double>> x1 = {{0.5, 0.5}};
    static const std::vector<std::pair<double, double>> x2 = {{0.25, 0.5}, {0.75, 0.5}};
    static const std::vector<std::pair<double, double>> x4 = {{0.25, 0.25}, {0.75, 0.25}, {0.25, 0.75}, {0.75, 0.75}};
    static const std::vector<std::pair<double, double>> x8 = {{0.25, 0.25}, {0.5, 0.25}, {0.75, 0.25}, {0.25, 0.5},
                                                              {0.75, 0.5},  {0.25, 0.75}, {0.5, 0.75}, {0.75, 0.75}};
    static const std::vector<std::pair<double, double>> x16 = [] {
        std::vector<std::pair<double, double>> offsets;
        const double steps[] = {0.125, 0.375, 0.625, 0.875};
        for (double y: steps)
            for (double x: steps) offsets.emplace_back(x, y);
        return offsets;
    }();
    switch (samples) {
    case AASamples::X1: return x1;
    case AASamples::X2: return x2;
    case AASamples::X4: return x4;
    case AASamples::X8: return x8;
    case AASamples::X16: return x16;
    }
    return x1;
}

Camera::Camera(unsigned h, unsigned v, double fov) : hsize(h), vsize(v), field_of_view(fov) {
    double half_view = std::tan(field_of_view / 2.0);
    double aspect = static_cast<double>(hsize) / static_cast<double>(vsize);
    if (aspect >= 1.0) {
        half_width = half_view;
        half_height = half_view / aspect;
    }
    else {
        half_width = half_view * aspect;
        half_height = half_view;
    }
    pixel_size = half_width * 2.0 / hsize;
}

void Camera::set_transform(const glm::dmat4 &m) {
    if (!invertible(m)) throw std::invalid_argument("camera transform is not invertible: " + glm::to_string(m));
    transform = m;
    inverse = glm::inverse(m);
}

void Camera::set_num_threads(unsigned n) {
    if (n == 0) throw std::invalid_argument("number of threads must be greater than zero");
    options.num_threads = n;
}

Ray Camera::ray_for_pixel(unsigned px, unsigned py) const { return ray_for_pixel(px, py, 0.5, 0.5); }

Ray Camera::ray_for_pixel(unsigned px, unsigned py, double xoffset, double yoffset) const {
    double world_x = half_width - (px + xoffset) * pixel_size;
    double world_y = half_height - (py + yoffset) * pixel_size;
    glm::dvec3 pixel = transform_point(inverse, glm::dvec3(world_x, world_y, -1.0));
    glm::dvec3 origin = transform_point(inverse, glm::dvec3(0.0));
    return Ray(origin, glm::normalize(pixel - origin));
}

std::vector<Ray> Camera::rays_for_pixel(unsigned px, unsigned py) const {
    std::vector<Ray> rays;
    for (auto &[xoffset, yoffset]: sample_offsets(options.aa_samples)) rays.push_back(ray_for_pixel(px, py, xoffset, yoffset));
    return rays;
}
