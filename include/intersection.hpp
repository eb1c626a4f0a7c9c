#ifndef INTERSECTION_HPP
#define INTERSECTION_HPP

#include <vector>

#include "shape.hpp"

void sort_intersections(std::vector<Intersection> &xs);
// lowest non negative t in a sorted list, nullptr when there is none
const Intersection *hit(const std::vector<Intersection> &xs);
// like hit, skipping objects that do not cast shadows
const Intersection *shadow_hit(const std::vector<Intersection> &xs);

struct Computations {
    double t = 0.0;
    const Shape *object = nullptr;
    glm::dmat4 world_to_object = glm::dmat4(1.0);
    glm::dvec3 point, over_point, under_point;
    glm::dvec3 eyev, normalv, reflectv;
    bool inside = false;
    double n1 = 1.0, n2 = 1.0;
};

Computations prepare_computations(const Intersection &hit, const Ray &ray, const std::vector<Intersection> &xs);
Computations prepare_computations(const Intersection &hit, const Ray &ray);
double schlick(const Computations &comps);

#endif
