#include <algorithm>
#include <stdexcept>

#include "intersection.hpp"
#include "shape.hpp"

Csg::Csg() {}

Csg::Csg(CsgOperation op, Shape l, Shape r)
    : operation(op), left(std::make_unique<Shape>(std::move(l))), right(std::make_unique<Shape>(std::move(r))) {
    recompute_bounds(*this);
}

Csg::Csg(const Csg &other) : base(other.base), operation(other.operation), bounds(other.bounds) {
    if (other.left) left = std::make_unique<Shape>(*other.left);
    if (other.right) right = std::make_unique<Shape>(*other.right);
}

Csg::Csg(Csg &&other) noexcept = default;

Csg &Csg::operator=(const Csg &other) {
    if (this == &other) return *this;
    Csg copy(other);
    *this = std::move(copy);
    return *this;
}

Csg &Csg::operator=(Csg &&other) noexcept = default;

Csg::~Csg() = default;

void recompute_bounds(Csg &csg) {
    csg.bounds = BoundingBox();
    if (csg.left) csg.bounds.add(parent_space_bounds(*csg.left));
    if (csg.right) csg.bounds.add(parent_space_bounds(*csg.right));
}

bool intersection_allowed(CsgOperation op, bool lhit, bool inl, bool inr) {
    switch (op) {
    case CsgOperation::Union:
        return (lhit && !inr) || (!lhit && !inl);
    case CsgOperation::Intersection:
        return (lhit && inr) || (!lhit && inl);
    case CsgOperation::Difference:
        return (lhit && !inr) || (!lhit && inl);
    }
    return false;
}

std::vector<Intersection> filter_intersections(const Csg &csg, const std::vector<Intersection> &xs) {
    bool inl = false, inr = false;
    std::vector<Intersection> result;
    for (auto &x: xs) {
        bool lhit = includes(*csg.left, x.object);
        if (intersection_allowed(csg.operation, lhit, inl, inr)) result.push_back(x);
        if (lhit) inl = !inl;
        else
            inr = !inr;
    }
    return result;
}

void local_intersect(const Csg &csg, const Shape &, const Ray &ray, const glm::dmat4 &world_to_object, std::vector<Intersection> &xs) {
    if (!csg.left || !csg.right || !csg.bounds.intersects(ray)) return;
    std::vector<Intersection> children;
    intersect(*csg.left, ray, world_to_object, children);
    intersect(*csg.right, ray, world_to_object, children);
    sort_intersections(children);
    std::vector<Intersection> kept = filter_intersections(csg, children);
    xs.insert(xs.end(), kept.begin(), kept.end());
}

glm::dvec3 local_normal_at(const Csg &, const glm::dvec3 &, const Intersection &) {
    throw std::logic_error("local_normal_at called on a csg; normals come from the leaf hit");
}

BoundingBox bounds_of(const Csg &csg) { return csg.bounds; }

void divide(Csg &csg, std::size_t threshold) {
    if (csg.left) divide(*csg.left, threshold);
    if (csg.right) divide(*csg.right, threshold);
}
