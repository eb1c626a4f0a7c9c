#ifndef SHAPE_HPP
#define SHAPE_HPP

#include <cstddef>
#include <memory>
#include <utility>
#include <variant>
#include <vector>

#include "bounding_box.hpp"
#include "material.hpp"
#include "ray.hpp"

struct ShapeBase {
    glm::dmat4 transform = glm::dmat4(1.0);
    glm::dmat4 inverse = glm::dmat4(1.0);
    glm::dmat4 inverse_transpose = glm::dmat4(1.0);
    Material material;
    bool casts_shadow = true;
};

struct Sphere {
    ShapeBase base;
};

struct Plane {
    ShapeBase base;
};

struct Cube {
    ShapeBase base;
};

struct Cylinder {
    ShapeBase base;
    double minimum = -INF;
    double maximum = INF;
    bool closed = false;
};

struct Cone {
    ShapeBase base;
    double minimum = -INF;
    double maximum = INF;
    bool closed = false;
};

struct Triangle {
    ShapeBase base;
    glm::dvec3 p1, p2, p3;
    glm::dvec3 e1, e2;
    glm::dvec3 normal;
    Triangle(glm::dvec3 p1, glm::dvec3 p2, glm::dvec3 p3);
};

struct SmoothTriangle {
    ShapeBase base;
    glm::dvec3 p1, p2, p3;
    glm::dvec3 n1, n2, n3;
    glm::dvec3 e1, e2;
    SmoothTriangle(glm::dvec3 p1, glm::dvec3 p2, glm::dvec3 p3, glm::dvec3 n1, glm::dvec3 n2, glm::dvec3 n3);
};

struct Group;
struct Csg;

using Shape = std::variant<Sphere, Plane, Cube, Cylinder, Cone, Triangle, SmoothTriangle, Group, Csg>;

// children keep their own transform, relative to the group. bounds is a cache
// filled by add_child; after editing a child in place call recompute_bounds
struct Group {
    ShapeBase base;
    std::vector<Shape> children;
    BoundingBox bounds;
};

enum class CsgOperation { Union, Intersection, Difference };

struct Csg {
    ShapeBase base;
    CsgOperation operation = CsgOperation::Union;
    std::unique_ptr<Shape> left, right;
    BoundingBox bounds;
    Csg();
    Csg(CsgOperation operation, Shape left, Shape right);
    Csg(const Csg &other);
    Csg(Csg &&other) noexcept;
    Csg &operator=(const Csg &other);
    Csg &operator=(Csg &&other) noexcept;
    ~Csg();
};

struct Intersection {
    double t = 0.0;
    const Shape *object = nullptr;
    // composed inverse transforms from world space down to the leaf hit
    glm::dmat4 world_to_object = glm::dmat4(1.0);
    double u = 0.0, v = 0.0;
    Intersection();
    // world_to_object defaults to the object's own inverse (a top level shape)
    Intersection(double t, const Shape *object);
    Intersection(double t, const Shape *object, const glm::dmat4 &world_to_object, double u = 0.0, double v = 0.0);
};

const ShapeBase &shape_base(const Shape &shape);
ShapeBase &shape_base(Shape &shape);
void set_transform(Shape &shape, const glm::dmat4 &transform);
void set_material(Shape &shape, const Material &material);
// shadow rays test the leaf hit, so the flag is pushed down to every descendant
void set_casts_shadow(Shape &shape, bool casts_shadow);
const Material &shape_material(const Shape &shape);

BoundingBox local_bounds(const Shape &shape);
BoundingBox parent_space_bounds(const Shape &shape);

void intersect(const Shape &shape, const Ray &ray, const glm::dmat4 &world_to_parent, std::vector<Intersection> &xs);
std::vector<Intersection> intersect(const Shape &shape, const Ray &ray);
// ray already in the shape's local space
std::vector<Intersection> local_intersect(const Shape &shape, const Ray &local_ray);

glm::dvec3 local_normal_at(const Shape &shape, const glm::dvec3 &local_point, const Intersection &hit);
glm::dvec3 normal_at(const Intersection &hit, const glm::dvec3 &world_point);
glm::dvec3 normal_at(const Shape &shape, const glm::dvec3 &world_point);

bool includes(const Shape &shape, const Shape *other);
// refreshes the cached bounds of every composite below and including shape
void recompute_bounds(Shape &shape);
void divide(Shape &shape, std::size_t threshold);

Shape make_cylinder(double minimum, double maximum, bool closed);
Shape make_cone(double minimum, double maximum, bool closed);

// primitive.cpp
void local_intersect(const Sphere &sphere, const Shape &self, const Ray &ray, const glm::dmat4 &world_to_object, std::vector<Intersection> &xs);
void local_intersect(const Plane &plane, const Shape &self, const Ray &ray, const glm::dmat4 &world_to_object, std::vector<Intersection> &xs);
void local_intersect(const Cube &cube, const Shape &self, const Ray &ray, const glm::dmat4 &world_to_object, std::vector<Intersection> &xs);
void local_intersect(const Cylinder &cyl, const Shape &self, const Ray &ray, const glm::dmat4 &world_to_object, std::vector<Intersection> &xs);
void local_intersect(const Cone &cone, const Shape &self, const Ray &ray, const glm::dmat4 &world_to_object, std::vector<Intersection> &xs);
void local_intersect(const Triangle &tri, const Shape &self, const Ray &ray, const glm::dmat4 &world_to_object, std::vector<Intersection> &xs);
void local_intersect(const SmoothTriangle &tri, const Shape &self, const Ray &ray, const glm::dmat4 &world_to_object, std::vector<Intersection> &xs);
glm::dvec3 local_normal_at(const Sphere &sphere, const glm::dvec3 &p, const Intersection &hit);
glm::dvec3 local_normal_at(const Plane &plane, const glm::dvec3 &p, const Intersection &hit);
glm::dvec3 local_normal_at(const Cube &cube, const glm::dvec3 &p, const Intersection &hit);
glm::dvec3 local_normal_at(const Cylinder &cyl, const glm::dvec3 &p, const Intersection &hit);
glm::dvec3 local_normal_at(const Cone &cone, const glm::dvec3 &p, const Intersection &hit);
glm::dvec3 local_normal_at(const Triangle &tri, const glm::dvec3 &p, const Intersection &hit);
glm::dvec3 local_normal_at(const SmoothTriangle &tri, const glm::dvec3 &p, const Intersection &hit);
BoundingBox bounds_of(const Sphere &sphere);
BoundingBox bounds_of(const Plane &plane);
BoundingBox bounds_of(const Cube &cube);
BoundingBox bounds_of(const Cylinder &cyl);
BoundingBox bounds_of(const Cone &cone);
BoundingBox bounds_of(const Triangle &tri);
BoundingBox bounds_of(const SmoothTriangle &tri);

// group.cpp
void add_child(Group &group, Shape child);
void recompute_bounds(Group &group);
void local_intersect(const Group &group, const Shape &self, const Ray &ray, const glm::dmat4 &world_to_object, std::vector<Intersection> &xs);
glm::dvec3 local_normal_at(const Group &group, const glm::dvec3 &p, const Intersection &hit);
BoundingBox bounds_of(const Group &group);
std::pair<std::vector<Shape>, std::vector<Shape>> partition_children(Group &group);
void make_subgroup(Group &group, std::vector<Shape> shapes);
void divide(Group &group, std::size_t threshold);

// csg.cpp
void recompute_bounds(Csg &csg);
bool intersection_allowed(CsgOperation op, bool lhit, bool inl, bool inr);
std::vector<Intersection> filter_intersections(const Csg &csg, const std::vector<Intersection> &xs);
void local_intersect(const Csg &csg, const Shape &self, const Ray &ray, const glm::dmat4 &world_to_object, std::vector<Intersection> &xs);
glm::dvec3 local_normal_at(const Csg &csg, const glm::dvec3 &p, const Intersection &hit);
BoundingBox bounds_of(const Csg &csg);
void divide(Csg &csg, std::size_t threshold);

#endif
