#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "ray_tracer.hpp"

namespace raytracer {
glm::dvec3 pixel_color(const World &world, const Camera &camera, unsigned x, unsigned y) {
    std::vector<Ray> rays = camera.rays_for_pixel(x, y);
    glm::dvec3 color(0.0);
    for (auto &ray: rays) color += world.color_at(ray, camera.options.max_depth);
    return color / static_cast<double>(rays.size());
}

std::vector<glm::dvec3> render_segment(const World &world, const Camera &camera, unsigned start, unsigned end) {
    std::vector<glm::dvec3> colors;
    colors.reserve(static_cast<size_t>(end - start) * camera.hsize);
    for (unsigned y = start; y < end; ++y) {
        for (unsigned x = 0; x < camera.hsize; ++x) colors.push_back(pixel_color(world, camera, x, y));
    }
    return colors;
}

Image run(const World &world, const Camera &camera, bool show_progress) {
    unsigned num_threads = camera.options.num_threads;
    if (num_threads == 0) throw std::invalid_argument("number of threads must be greater than zero");
    auto begin = std::chrono::steady_clock::now();
    unsigned rows_per_thread = camera.vsize / num_threads;
    if (show_progress)
        std::cout << "running with " << num_threads << " threads: assigning " << rows_per_thread << " rows per thread" << std::endl;

    std::vector<std::vector<glm::dvec3>> results(num_threads);
    std::vector<unsigned> starts(num_threads);
    std::vector<std::thread> threads(num_threads);
    for (unsigned i = 0; i < num_threads; ++i) {
        unsigned start = i * rows_per_thread;
        unsigned end = (i == num_threads - 1) ? camera.vsize : (i + 1) * rows_per_thread;
        starts[i] = start;
        threads[i] = std::thread([&world, &camera, &results, i, start, end]() { results[i] = render_segment(world, camera, start, end); });
    }
    for (auto &thread: threads) thread.join();

    Image img(camera.hsize, camera.vsize);
    for (unsigned i = 0; i < num_threads; ++i) {
        for (size_t k = 0; k < results[i].size(); ++k) {
            unsigned y = starts[i] + static_cast<unsigned>(k / camera.hsize);
            unsigned x = static_cast<unsigned>(k % camera.hsize);
            img.set(x, y, results[i][k]);
        }
    }
    if (show_progress) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - begin);
        std::cout << "rendered in " << elapsed.count() << " ms" << std::endl;
    }
    return img;
}
}
