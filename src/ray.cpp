#include "ray.hpp"

Ray::Ray() {}
Ray::Ray(glm::dvec3 o, glm::dvec3 d) : origin(o), direction(d) {}

glm::dvec3 Ray::position(double t) const { return origin + direction * t; }

Ray transform_ray(const Ray &ray, const glm::dmat4 &transform) {
    Ray transformed_ray;
    transformed_ray.origin = transform_point(transform, ray.origin);
    transformed_ray.direction = transform_vector(transform, ray.direction);
    return transformed_ray;
}
