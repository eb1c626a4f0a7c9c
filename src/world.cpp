#include <cmath>

#include "world.hpp"

std::vector<Intersection> World::intersect(const Ray &ray) const {
    std::vector<Intersection> xs;
    for (auto &object: objects) ::intersect(object, ray, glm::dmat4(1.0), xs);
    sort_intersections(xs);
    return xs;
}

glm::dvec3 World::shade_hit(const Computations &comps, unsigned remaining) const {
    const Material &material = shape_material(*comps.object);
    glm::dvec3 surface(0.0);
    for (auto &light: lights) {
        bool shadowed = is_shadowed(comps.over_point, light);
        surface += lighting(material, comps.world_to_object, light, comps.over_point, comps.eyev, comps.normalv, shadowed);
    }
    glm::dvec3 reflected = reflected_color(comps, remaining);
    glm::dvec3 refracted = refracted_color(comps, remaining);
    if (material.reflective > 0 && material.transparency > 0) {
        double reflectance = schlick(comps);
        return surface + reflected * reflectance + refracted * (1.0 - reflectance);
    }
    return surface + reflected + refracted;
}

glm::dvec3 World::color_at(const Ray &ray, unsigned remaining) const {
    std::vector<Intersection> xs = intersect(ray);
    const Intersection *h = hit(xs);
    if (!h) return glm::dvec3(0.0);
    return shade_hit(prepare_computations(*h, ray, xs), remaining);
}

bool World::is_shadowed(const glm::dvec3 &point, const PointLight &light) const {
    glm::dvec3 v = light.position - point;
    double distance = glm::length(v);
    Ray ray(point, glm::normalize(v));
    std::vector<Intersection> xs = intersect(ray);
    const Intersection *h = shadow_hit(xs);
    return h && h->t < distance;
}

glm::dvec3 World::reflected_color(const Computations &comps, unsigned remaining) const {
    double reflective = shape_material(*comps.object).reflective;
    if (remaining == 0 || std::abs(reflective) < EPS) return glm::dvec3(0.0);
    Ray reflect_ray(comps.over_point, comps.reflectv);
    return color_at(reflect_ray, remaining - 1) * reflective;
}

glm::dvec3 World::refracted_color(const Computations &comps, unsigned remaining) const {
    double transparency = shape_material(*comps.object).transparency;
    if (remaining == 0 || std::abs(transparency) < EPS) return glm::dvec3(0.0);
    double n_ratio = comps.n1 / comps.n2;
    double cos_i = glm::dot(comps.eyev, comps.normalv);
    double sin2_t = n_ratio * n_ratio * (1.0 - cos_i * cos_i);
    // total internal reflection
    if (sin2_t > 1.0) return glm::dvec3(0.0);
    double cos_t = std::sqrt(1.0 - sin2_t);
    glm::dvec3 direction = comps.normalv * (n_ratio * cos_i - cos_t) - comps.eyev * n_ratio;
    Ray refract_ray(comps.under_point, direction);
    return color_at(refract_ray, remaining - 1) * transparency;
}

void World::divide(std::size_t threshold) {
    for (auto &object: objects) ::divide(object, threshold);
}

World default_world() {
    World world;
    PointLight light;
    light.position = glm::dvec3(-10.0, 10.0, -10.0);
    light.intensity = glm::dvec3(1.0);
    world.lights.push_back(light);

    Sphere s1;
    s1.base.material.color = glm::dvec3(0.8, 1.0, 0.6);
    s1.base.material.diffuse = 0.7;
    s1.base.material.specular = 0.2;
    world.objects.push_back(s1);

    Shape s2 = Sphere();
    set_transform(s2, scaling(0.5, 0.5, 0.5));
    world.objects.push_back(s2);
    return world;
}
