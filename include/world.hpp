#ifndef WORLD_HPP
#define WORLD_HPP

#include <vector>

#include "intersection.hpp"

#define MAX_RECURSION_DEPTH 5

struct World {
    std::vector<Shape> objects;
    std::vector<PointLight> lights;

    // all hits along the ray, sorted by t
    std::vector<Intersection> intersect(const Ray &ray) const;
    glm::dvec3 shade_hit(const Computations &comps, unsigned remaining = MAX_RECURSION_DEPTH) const;
    glm::dvec3 color_at(const Ray &ray, unsigned remaining = MAX_RECURSION_DEPTH) const;
    bool is_shadowed(const glm::dvec3 &point, const PointLight &light) const;
    glm::dvec3 reflected_color(const Computations &comps, unsigned remaining = MAX_RECURSION_DEPTH) const;
    glm::dvec3 refracted_color(const Computations &comps, unsigned remaining = MAX_RECURSION_DEPTH) const;
    void divide(std::size_t threshold);
};

// two concentric spheres lit from (-10, 10, -10)
World default_world();

#endif
