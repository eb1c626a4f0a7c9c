#include <cmath>

#include "ray_tracer.hpp"
#include "test_helpers.hpp"

namespace {
Camera default_camera(unsigned hsize, unsigned vsize) {
    Camera c(hsize, vsize, M_PI / 2);
    c.set_transform(view_transform(glm::dvec3(0, 0, -5), glm::dvec3(0), glm::dvec3(0, 1, 0)));
    return c;
}
}

TEST(Renderer, RendersDefaultWorld) {
    World w = default_world();
    Image img = raytracer::run(w, default_camera(11, 11), false);
    EXPECT_EQ(img.width, 11);
    EXPECT_EQ(img.height, 11);
    EXPECT_VEC_NEAR(img.get(5, 5), glm::dvec3(0.38066, 0.47583, 0.2855), 1e-4);
}

TEST(Renderer, PixelColorMatchesColorAt) {
    World w = default_world();
    Camera c = default_camera(11, 11);
    EXPECT_VEC_EQ(raytracer::pixel_color(w, c, 3, 7), w.color_at(c.ray_for_pixel(3, 7)));
}

TEST(Renderer, PixelColorAveragesSamples) {
    World w = default_world();
    Camera c = default_camera(11, 11);
    c.options.aa_samples = AASamples::X4;
    glm::dvec3 expected(0.0);
    for (auto &ray: c.rays_for_pixel(5, 4)) expected += w.color_at(ray);
    EXPECT_VEC_EQ(raytracer::pixel_color(w, c, 5, 4), expected / 4.0);
}

TEST(Renderer, SegmentCoversRequestedRows) {
    World w = default_world();
    Camera c = default_camera(7, 5);
    auto colors = raytracer::render_segment(w, c, 1, 3);
    ASSERT_EQ(colors.size(), 14u);
    EXPECT_VEC_EQ(colors[0], raytracer::pixel_color(w, c, 0, 1));
    EXPECT_VEC_EQ(colors[13], raytracer::pixel_color(w, c, 6, 2));
}

TEST(Renderer, ThreadCountDoesNotChangeImage) {
    World w = default_world();
    Camera c = default_camera(20, 17);
    c.options.aa_samples = AASamples::X2;
    Image single = raytracer::run(w, c, false);
    for (unsigned threads: {2u, 3u, 4u, 32u}) {
        c.set_num_threads(threads);
        Image multi = raytracer::run(w, c, false);
        ASSERT_EQ(multi.data.size(), single.data.size());
        for (size_t i = 0; i < single.data.size(); ++i) {
            EXPECT_EQ(multi.data[i], single.data[i]) << threads << " threads, pixel " << i;
        }
    }
}

TEST(Renderer, ZeroThreadsIsRejected) {
    World w = default_world();
    Camera c = default_camera(4, 4);
    c.options.num_threads = 0;
    EXPECT_THROW(raytracer::run(w, c, false), std::invalid_argument);
}
