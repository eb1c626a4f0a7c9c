#include <cmath>

#include "world.hpp"
#include "test_helpers.hpp"

namespace {
const double h = std::sqrt(2.0) / 2;
}

TEST(World, EmptyWorld) {
    World w;
    EXPECT_TRUE(w.objects.empty());
    EXPECT_TRUE(w.lights.empty());
    EXPECT_VEC_EQ(w.color_at(Ray(glm::dvec3(0), glm::dvec3(0, 0, 1))), glm::dvec3(0));
}

TEST(World, DefaultWorld) {
    World w = default_world();
    ASSERT_EQ(w.lights.size(), 1u);
    EXPECT_VEC_EQ(w.lights[0].position, glm::dvec3(-10, 10, -10));
    EXPECT_VEC_EQ(w.lights[0].intensity, glm::dvec3(1));
    ASSERT_EQ(w.objects.size(), 2u);
    EXPECT_VEC_EQ(shape_material(w.objects[0]).color, glm::dvec3(0.8, 1.0, 0.6));
    EXPECT_DOUBLE_EQ(shape_material(w.objects[0]).diffuse, 0.7);
    EXPECT_DOUBLE_EQ(shape_material(w.objects[0]).specular, 0.2);
    EXPECT_MAT_EQ(shape_base(w.objects[1]).transform, scaling(0.5, 0.5, 0.5));
}

TEST(World, IntersectIsSorted) {
    World w = default_world();
    auto xs = w.intersect(Ray(glm::dvec3(0, 0, -5), glm::dvec3(0, 0, 1)));
    ASSERT_EQ(xs.size(), 4u);
    EXPECT_NEAR(xs[0].t, 4, EPS);
    EXPECT_NEAR(xs[1].t, 4.5, EPS);
    EXPECT_NEAR(xs[2].t, 5.5, EPS);
    EXPECT_NEAR(xs[3].t, 6, EPS);
}

TEST(World, ShadeHitOutside) {
    World w = default_world();
    Ray r(glm::dvec3(0, 0, -5), glm::dvec3(0, 0, 1));
    Computations comps = prepare_computations(Intersection(4, &w.objects[0]), r);
    EXPECT_VEC_NEAR(w.shade_hit(comps), glm::dvec3(0.38066, 0.47583, 0.2855), 1e-4);
}

TEST(World, ShadeHitInside) {
    World w = default_world();
    w.lights[0].position = glm::dvec3(0, 0.25, 0);
    Ray r(glm::dvec3(0), glm::dvec3(0, 0, 1));
    Computations comps = prepare_computations(Intersection(0.5, &w.objects[1]), r);
    EXPECT_VEC_NEAR(w.shade_hit(comps), glm::dvec3(0.90498), 1e-4);
}

TEST(World, ShadeHitInShadow) {
    World w;
    PointLight light;
    light.position = glm::dvec3(0, 0, -10);
    w.lights.push_back(light);
    w.objects.push_back(Sphere());
    Shape s2 = Sphere();
    set_transform(s2, translation(0, 0, 10));
    w.objects.push_back(s2);
    Ray r(glm::dvec3(0, 0, 5), glm::dvec3(0, 0, 1));
    Computations comps = prepare_computations(Intersection(4, &w.objects[1]), r);
    EXPECT_VEC_EQ(w.shade_hit(comps), glm::dvec3(0.1));
}

TEST(World, ColorAtMissAndHit) {
    World w = default_world();
    EXPECT_VEC_EQ(w.color_at(Ray(glm::dvec3(0, 0, -5), glm::dvec3(0, 1, 0))), glm::dvec3(0));
    EXPECT_VEC_NEAR(w.color_at(Ray(glm::dvec3(0, 0, -5), glm::dvec3(0, 0, 1))), glm::dvec3(0.38066, 0.47583, 0.2855), 1e-4);
}

TEST(World, ColorAtIntersectionBehindRay) {
    World w = default_world();
    shape_base(w.objects[0]).material.ambient = 1;
    shape_base(w.objects[1]).material.ambient = 1;
    glm::dvec3 inner_color = shape_material(w.objects[1]).color;
    EXPECT_VEC_EQ(w.color_at(Ray(glm::dvec3(0, 0, 0.75), glm::dvec3(0, 0, -1))), inner_color);
}

TEST(World, Shadows) {
    World w = default_world();
    const PointLight &light = w.lights[0];
    EXPECT_FALSE(w.is_shadowed(glm::dvec3(0, 10, 0), light));
    EXPECT_TRUE(w.is_shadowed(glm::dvec3(10, -10, 10), light));
    EXPECT_FALSE(w.is_shadowed(glm::dvec3(-20, 20, -20), light));
    EXPECT_FALSE(w.is_shadowed(glm::dvec3(-2, 2, -2), light));
}

TEST(World, ObjectsThatDoNotCastShadows) {
    World w = default_world();
    for (auto &object: w.objects) shape_base(object).casts_shadow = false;
    EXPECT_FALSE(w.is_shadowed(glm::dvec3(10, -10, 10), w.lights[0]));
}

TEST(World, ReflectedColorOfNonReflectiveMaterial) {
    World w = default_world();
    shape_base(w.objects[1]).material.ambient = 1;
    Ray r(glm::dvec3(0), glm::dvec3(0, 0, 1));
    Computations comps = prepare_computations(Intersection(1, &w.objects[1]), r);
    EXPECT_VEC_EQ(w.reflected_color(comps), glm::dvec3(0));
}

class ReflectiveFloor : public ::testing::Test {
protected:
    void SetUp() override {
        w = default_world();
        Shape floor = Plane();
        shape_base(floor).material.reflective = 0.5;
        set_transform(floor, translation(0, -1, 0));
        w.objects.push_back(floor);
    }
    Computations floor_hit() const {
        Ray r(glm::dvec3(0, 0, -3), glm::dvec3(0, -h, h));
        return prepare_computations(Intersection(std::sqrt(2.0), &w.objects.back()), r);
    }
    World w;
};

TEST_F(ReflectiveFloor, ReflectedColor) {
    EXPECT_VEC_NEAR(w.reflected_color(floor_hit()), glm::dvec3(0.19032, 0.2379, 0.14274), 1e-3);
}

TEST_F(ReflectiveFloor, ShadeHitAddsReflection) {
    EXPECT_VEC_NEAR(w.shade_hit(floor_hit()), glm::dvec3(0.87677, 0.92436, 0.82918), 1e-3);
}

TEST_F(ReflectiveFloor, NoReflectionWhenDepthExhausted) {
    EXPECT_VEC_EQ(w.reflected_color(floor_hit(), 0), glm::dvec3(0));
}

TEST(World, MutuallyReflectiveSurfacesTerminate) {
    World w;
    PointLight light;
    w.lights.push_back(light);
    Shape lower = Plane();
    shape_base(lower).material.reflective = 1;
    set_transform(lower, translation(0, -1, 0));
    Shape upper = Plane();
    shape_base(upper).material.reflective = 1;
    set_transform(upper, translation(0, 1, 0));
    w.objects.push_back(lower);
    w.objects.push_back(upper);
    glm::dvec3 color = w.color_at(Ray(glm::dvec3(0), glm::dvec3(0, 1, 0)));
    EXPECT_TRUE(std::isfinite(color.r));
    EXPECT_GT(color.r, 0.0);
}

TEST(World, RefractedColorOfOpaqueSurface) {
    World w = default_world();
    Ray r(glm::dvec3(0, 0, -5), glm::dvec3(0, 0, 1));
    std::vector<Intersection> xs = {Intersection(4, &w.objects[0]), Intersection(6, &w.objects[0])};
    EXPECT_VEC_EQ(w.refracted_color(prepare_computations(xs[0], r, xs)), glm::dvec3(0));
}

TEST(World, RefractedColorAtMaximumDepth) {
    World w = default_world();
    shape_base(w.objects[0]).material.transparency = 1;
    shape_base(w.objects[0]).material.refractive_index = 1.5;
    Ray r(glm::dvec3(0, 0, -5), glm::dvec3(0, 0, 1));
    std::vector<Intersection> xs = {Intersection(4, &w.objects[0]), Intersection(6, &w.objects[0])};
    EXPECT_VEC_EQ(w.refracted_color(prepare_computations(xs[0], r, xs), 0), glm::dvec3(0));
}

TEST(World, RefractedColorUnderTotalInternalReflection) {
    World w = default_world();
    shape_base(w.objects[0]).material.transparency = 1;
    shape_base(w.objects[0]).material.refractive_index = 1.5;
    Ray r(glm::dvec3(0, 0, h), glm::dvec3(0, 1, 0));
    std::vector<Intersection> xs = {Intersection(-h, &w.objects[0]), Intersection(h, &w.objects[0])};
    EXPECT_VEC_EQ(w.refracted_color(prepare_computations(xs[1], r, xs)), glm::dvec3(0));
}

class TransparentFloor : public ::testing::Test {
protected:
    void SetUp() override {
        w = default_world();
        Shape floor = Plane();
        set_transform(floor, translation(0, -1, 0));
        shape_base(floor).material.transparency = 0.5;
        shape_base(floor).material.refractive_index = 1.5;
        Shape ball = Sphere();
        shape_base(ball).material.color = glm::dvec3(1, 0, 0);
        shape_base(ball).material.ambient = 0.5;
        set_transform(ball, translation(0, -3.5, -0.5));
        w.objects.push_back(floor);
        w.objects.push_back(ball);
    }
    glm::dvec3 shade() const {
        Ray r(glm::dvec3(0, 0, -3), glm::dvec3(0, -h, h));
        std::vector<Intersection> xs = {Intersection(std::sqrt(2.0), &w.objects[2])};
        return w.shade_hit(prepare_computations(xs[0], r, xs));
    }
    World w;
};

TEST_F(TransparentFloor, ShadeHitAddsRefraction) {
    EXPECT_VEC_NEAR(shade(), glm::dvec3(0.93642, 0.68642, 0.68642), 1e-3);
}

TEST_F(TransparentFloor, ShadeHitBlendsWithSchlick) {
    shape_base(w.objects[2]).material.reflective = 0.5;
    EXPECT_VEC_NEAR(shade(), glm::dvec3(0.93391, 0.69643, 0.69243), 1e-3);
}

TEST(World, DivideGroupsKeepsColor) {
    World w = default_world();
    Shape g = Group();
    for (int i = 0; i < 6; ++i) {
        Shape s = Sphere();
        set_transform(s, translation(3.0 * i, 5, 0) * scaling(0.5, 0.5, 0.5));
        add_child(std::get<Group>(g), s);
    }
    w.objects.push_back(g);
    Ray r(glm::dvec3(0, 0, -5), glm::dvec3(0, 0, 1));
    glm::dvec3 before = w.color_at(r);
    w.divide(2);
    EXPECT_GT(std::get<Group>(w.objects[2]).children.size(), 0u);
    EXPECT_VEC_EQ(w.color_at(r), before);
}
