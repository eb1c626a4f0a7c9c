#ifndef RAY_HPP
#define RAY_HPP

#include "transform.hpp"

struct Ray {
    glm::dvec3 origin = glm::dvec3(0.0);
    glm::dvec3 direction = glm::dvec3(0.0);
    Ray();
    Ray(glm::dvec3 origin, glm::dvec3 direction);
    glm::dvec3 position(double t) const;
};

// direction is not renormalized, t is shared between world and local space
Ray transform_ray(const Ray &ray, const glm::dmat4 &transform);

#endif
