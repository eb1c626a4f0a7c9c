#include <algorithm>
#include <cmath>

#include "intersection.hpp"

void sort_intersections(std::vector<Intersection> &xs) {
    std::stable_sort(xs.begin(), xs.end(), [](const Intersection &a, const Intersection &b) { return a.t < b.t; });
}

const Intersection *hit(const std::vector<Intersection> &xs) {
    for (auto &x: xs) {
        if (x.t >= 0) return &x;
    }
    return nullptr;
}

const Intersection *shadow_hit(const std::vector<Intersection> &xs) {
    for (auto &x: xs) {
        if (x.t >= 0 && shape_base(*x.object).casts_shadow) return &x;
    }
    return nullptr;
}

namespace {
bool same_intersection(const Intersection &a, const Intersection &b) { return a.object == b.object && a.t == b.t; }

double refractive_index_of(const std::vector<const Shape *> &containers) {
    if (containers.empty()) return 1.0;
    return shape_material(*containers.back()).refractive_index;
}
}

Computations prepare_computations(const Intersection &hit, const Ray &ray, const std::vector<Intersection> &xs) {
    Computations comps;
    comps.t = hit.t;
    comps.object = hit.object;
    comps.world_to_object = hit.world_to_object;
    comps.point = ray.position(hit.t);
    comps.eyev = -ray.direction;
    comps.normalv = normal_at(hit, comps.point);
    if (glm::dot(comps.normalv, comps.eyev) < 0) {
        comps.inside = true;
        comps.normalv = -comps.normalv;
    }
    comps.over_point = comps.point + comps.normalv * EPS;
    comps.under_point = comps.point - comps.normalv * EPS;
    comps.reflectv = glm::reflect(ray.direction, comps.normalv);

    // objects the ray is currently inside, innermost last
    std::vector<const Shape *> containers;
    for (auto &x: xs) {
        bool is_hit = same_intersection(x, hit);
        if (is_hit) comps.n1 = refractive_index_of(containers);
        auto it = std::find(containers.begin(), containers.end(), x.object);
        if (it != containers.end()) containers.erase(it);
        else
            containers.push_back(x.object);
        if (is_hit) {
            comps.n2 = refractive_index_of(containers);
            break;
        }
    }
    return comps;
}

Computations prepare_computations(const Intersection &hit, const Ray &ray) {
    return prepare_computations(hit, ray, std::vector<Intersection>{hit});
}

double schlick(const Computations &comps) {
    double cos = glm::dot(comps.eyev, comps.normalv);
    if (comps.n1 > comps.n2) {
        double n = comps.n1 / comps.n2;
        double sin2_t = n * n * (1.0 - cos * cos);
        if (sin2_t > 1.0) return 1.0;
        cos = std::sqrt(1.0 - sin2_t);
    }
    double r0 = (comps.n1 - comps.n2) / (comps.n1 + comps.n2);
    r0 = r0 * r0;
    return r0 + (1.0 - r0) * std::pow(1.0 - cos, 5);
}
