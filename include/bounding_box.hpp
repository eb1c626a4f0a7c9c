#ifndef BOUNDING_BOX_HPP
#define BOUNDING_BOX_HPP

#include <utility>

#include "ray.hpp"

struct BoundingBox {
    glm::dvec3 min = glm::dvec3(INF), max = glm::dvec3(-INF);
    BoundingBox();
    BoundingBox(glm::dvec3 min, glm::dvec3 max);
    bool empty() const;
    void add(const glm::dvec3 &p);
    void add(const BoundingBox &box);
    bool contains(const glm::dvec3 &p) const;
    bool contains(const BoundingBox &box) const;
    BoundingBox transform(const glm::dmat4 &m) const;
    bool intersects(const Ray &ray) const;
    // halves along the longest axis; both halves equal the box when it cannot be split
    std::pair<BoundingBox, BoundingBox> split() const;
};

BoundingBox operator+(const BoundingBox &a, const BoundingBox &b);
bool operator==(const BoundingBox &a, const BoundingBox &b);

// [tmin, tmax] of a ray against the slab [min, max] on one axis
std::pair<double, double> check_axis(double origin, double direction, double min, double max);

#endif
