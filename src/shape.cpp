#include <algorithm>
#include <stdexcept>

#include "shape.hpp"

Intersection::Intersection() {}

Intersection::Intersection(double t_, const Shape *obj) : t(t_), object(obj) {
    if (object) world_to_object = shape_base(*object).inverse;
}

Intersection::Intersection(double t_, const Shape *obj, const glm::dmat4 &w2o, double u_, double v_)
    : t(t_), object(obj), world_to_object(w2o), u(u_), v(v_) {}

const ShapeBase &shape_base(const Shape &shape) {
    return std::visit([](auto &&arg) -> const ShapeBase & { return arg.base; }, shape);
}

ShapeBase &shape_base(Shape &shape) {
    return std::visit([](auto &&arg) -> ShapeBase & { return arg.base; }, shape);
}

void set_transform(Shape &shape, const glm::dmat4 &transform) {
    if (!invertible(transform)) throw std::invalid_argument("shape transform is not invertible: " + glm::to_string(transform));
    glm::dmat4 inverse = glm::inverse(transform);
    ShapeBase &base = shape_base(shape);
    base.transform = transform;
    base.inverse = inverse;
    base.inverse_transpose = glm::transpose(inverse);
}

void set_material(Shape &shape, const Material &material) {
    shape_base(shape).material = material;
    if (auto group = std::get_if<Group>(&shape)) {
        for (auto &child: group->children) set_material(child, material);
    }
    else if (auto csg = std::get_if<Csg>(&shape)) {
        if (csg->left) set_material(*csg->left, material);
        if (csg->right) set_material(*csg->right, material);
    }
}

void set_casts_shadow(Shape &shape, bool casts_shadow) {
    shape_base(shape).casts_shadow = casts_shadow;
    if (auto group = std::get_if<Group>(&shape)) {
        for (auto &child: group->children) set_casts_shadow(child, casts_shadow);
    }
    else if (auto csg = std::get_if<Csg>(&shape)) {
        if (csg->left) set_casts_shadow(*csg->left, casts_shadow);
        if (csg->right) set_casts_shadow(*csg->right, casts_shadow);
    }
}

const Material &shape_material(const Shape &shape) { return shape_base(shape).material; }

BoundingBox local_bounds(const Shape &shape) {
    return std::visit([](auto &&kind) { return bounds_of(kind); }, shape);
}

BoundingBox parent_space_bounds(const Shape &shape) {
    return local_bounds(shape).transform(shape_base(shape).transform);
}

void intersect(const Shape &shape, const Ray &ray, const glm::dmat4 &world_to_parent, std::vector<Intersection> &xs) {
    const ShapeBase &base = shape_base(shape);
    Ray local_ray = transform_ray(ray, base.inverse);
    glm::dmat4 world_to_object = base.inverse * world_to_parent;
    std::visit([&](auto &&kind) { local_intersect(kind, shape, local_ray, world_to_object, xs); }, shape);
}

std::vector<Intersection> intersect(const Shape &shape, const Ray &ray) {
    std::vector<Intersection> xs;
    intersect(shape, ray, glm::dmat4(1.0), xs);
    return xs;
}

std::vector<Intersection> local_intersect(const Shape &shape, const Ray &local_ray) {
    std::vector<Intersection> xs;
    const glm::dmat4 &world_to_object = shape_base(shape).inverse;
    std::visit([&](auto &&kind) { local_intersect(kind, shape, local_ray, world_to_object, xs); }, shape);
    return xs;
}

glm::dvec3 local_normal_at(const Shape &shape, const glm::dvec3 &local_point, const Intersection &hit) {
    return std::visit([&](auto &&kind) { return local_normal_at(kind, local_point, hit); }, shape);
}

glm::dvec3 normal_at(const Intersection &hit, const glm::dvec3 &world_point) {
    glm::dvec3 local_point = transform_point(hit.world_to_object, world_point);
    glm::dvec3 local_normal = local_normal_at(*hit.object, local_point, hit);
    glm::dvec3 world_normal = transform_vector(glm::transpose(hit.world_to_object), local_normal);
    return glm::normalize(world_normal);
}

glm::dvec3 normal_at(const Shape &shape, const glm::dvec3 &world_point) {
    const ShapeBase &base = shape_base(shape);
    Intersection hit(0.0, &shape);
    glm::dvec3 local_point = transform_point(base.inverse, world_point);
    glm::dvec3 local_normal = local_normal_at(shape, local_point, hit);
    return glm::normalize(transform_vector(base.inverse_transpose, local_normal));
}

bool includes(const Shape &shape, const Shape *other) {
    if (&shape == other) return true;
    if (auto group = std::get_if<Group>(&shape)) {
        return std::any_of(group->children.begin(), group->children.end(),
                           [other](const Shape &child) { return includes(child, other); });
    }
    if (auto csg = std::get_if<Csg>(&shape)) {
        return (csg->left && includes(*csg->left, other)) || (csg->right && includes(*csg->right, other));
    }
    return false;
}

void recompute_bounds(Shape &shape) {
    if (auto group = std::get_if<Group>(&shape)) {
        for (auto &child: group->children) recompute_bounds(child);
        recompute_bounds(*group);
    }
    else if (auto csg = std::get_if<Csg>(&shape)) {
        if (csg->left) recompute_bounds(*csg->left);
        if (csg->right) recompute_bounds(*csg->right);
        recompute_bounds(*csg);
    }
}

void divide(Shape &shape, std::size_t threshold) {
    if (auto group = std::get_if<Group>(&shape)) divide(*group, threshold);
    else if (auto csg = std::get_if<Csg>(&shape))
        divide(*csg, threshold);
}

Shape make_cylinder(double minimum, double maximum, bool closed) {
    Cylinder cyl;
    cyl.minimum = minimum;
    cyl.maximum = maximum;
    cyl.closed = closed;
    return cyl;
}

Shape make_cone(double minimum, double maximum, bool closed) {
    Cone cone;
    cone.minimum = minimum;
    cone.maximum = maximum;
    cone.closed = closed;
    return cone;
}
