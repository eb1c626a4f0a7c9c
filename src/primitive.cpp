#include <algorithm>
#include <cmath>

#include "shape.hpp"

Triangle::Triangle(glm::dvec3 a, glm::dvec3 b, glm::dvec3 c) : p1(a), p2(b), p3(c) {
    e1 = p2 - p1;
    e2 = p3 - p1;
    normal = glm::normalize(glm::cross(e2, e1));
}

SmoothTriangle::SmoothTriangle(glm::dvec3 a, glm::dvec3 b, glm::dvec3 c, glm::dvec3 na, glm::dvec3 nb, glm::dvec3 nc)
    : p1(a), p2(b), p3(c), n1(na), n2(nb), n3(nc) {
    e1 = p2 - p1;
    e2 = p3 - p1;
}

void local_intersect(const Sphere &, const Shape &self, const Ray &ray, const glm::dmat4 &world_to_object, std::vector<Intersection> &xs) {
    // unit sphere at the origin
    glm::dvec3 oc = ray.origin;
    double a = glm::dot(ray.direction, ray.direction);
    double b = 2.0 * glm::dot(oc, ray.direction);
    double c = glm::dot(oc, oc) - 1.0;
    double discriminant = b * b - 4 * a * c;
    if (discriminant < 0) return;
    double sqrtd = std::sqrt(discriminant);
    double t0 = (-b - sqrtd) / (2.0 * a);
    double t1 = (-b + sqrtd) / (2.0 * a);
    xs.emplace_back(t0, &self, world_to_object);
    xs.emplace_back(t1, &self, world_to_object);
}

void local_intersect(const Plane &, const Shape &self, const Ray &ray, const glm::dmat4 &world_to_object, std::vector<Intersection> &xs) {
    if (std::abs(ray.direction.y) < EPS) return;
    xs.emplace_back(-ray.origin.y / ray.direction.y, &self, world_to_object);
}

void local_intersect(const Cube &, const Shape &self, const Ray &ray, const glm::dmat4 &world_to_object, std::vector<Intersection> &xs) {
    auto [xtmin, xtmax] = check_axis(ray.origin.x, ray.direction.x, -1.0, 1.0);
    auto [ytmin, ytmax] = check_axis(ray.origin.y, ray.direction.y, -1.0, 1.0);
    auto [ztmin, ztmax] = check_axis(ray.origin.z, ray.direction.z, -1.0, 1.0);
    double tmin = std::max(xtmin, std::max(ytmin, ztmin));
    double tmax = std::min(xtmax, std::min(ytmax, ztmax));
    if (tmin > tmax) return;
    xs.emplace_back(tmin, &self, world_to_object);
    xs.emplace_back(tmax, &self, world_to_object);
}

namespace {
// is the point at t within the cap of the given radius
bool check_cap(const Ray &ray, double t, double radius) {
    double x = ray.origin.x + t * ray.direction.x;
    double z = ray.origin.z + t * ray.direction.z;
    return x * x + z * z <= radius * radius + EPS;
}

template <typename Radius>
void intersect_caps(double minimum, double maximum, bool closed, Radius radius, const Shape &self, const Ray &ray,
                    const glm::dmat4 &world_to_object, std::vector<Intersection> &xs) {
    if (!closed || std::abs(ray.direction.y) < EPS) return;
    double t = (minimum - ray.origin.y) / ray.direction.y;
    if (check_cap(ray, t, radius(minimum))) xs.emplace_back(t, &self, world_to_object);
    t = (maximum - ray.origin.y) / ray.direction.y;
    if (check_cap(ray, t, radius(maximum))) xs.emplace_back(t, &self, world_to_object);
}

void clip_to_range(double t0, double t1, double minimum, double maximum, const Shape &self, const Ray &ray,
                   const glm::dmat4 &world_to_object, std::vector<Intersection> &xs) {
    if (t0 > t1) std::swap(t0, t1);
    double y0 = ray.origin.y + t0 * ray.direction.y;
    if (minimum < y0 && y0 < maximum) xs.emplace_back(t0, &self, world_to_object);
    double y1 = ray.origin.y + t1 * ray.direction.y;
    if (minimum < y1 && y1 < maximum) xs.emplace_back(t1, &self, world_to_object);
}
}

void local_intersect(const Cylinder &cyl, const Shape &self, const Ray &ray, const glm::dmat4 &world_to_object, std::vector<Intersection> &xs) {
    auto radius = [](double) { return 1.0; };
    double a = ray.direction.x * ray.direction.x + ray.direction.z * ray.direction.z;
    if (std::abs(a) >= EPS) {
        double b = 2.0 * ray.origin.x * ray.direction.x + 2.0 * ray.origin.z * ray.direction.z;
        double c = ray.origin.x * ray.origin.x + ray.origin.z * ray.origin.z - 1.0;
        double disc = b * b - 4 * a * c;
        if (disc < 0) return;
        double sqrtd = std::sqrt(disc);
        clip_to_range((-b - sqrtd) / (2 * a), (-b + sqrtd) / (2 * a), cyl.minimum, cyl.maximum, self, ray, world_to_object, xs);
    }
    intersect_caps(cyl.minimum, cyl.maximum, cyl.closed, radius, self, ray, world_to_object, xs);
}

void local_intersect(const Cone &cone, const Shape &self, const Ray &ray, const glm::dmat4 &world_to_object, std::vector<Intersection> &xs) {
    auto radius = [](double y) { return std::abs(y); };
    const glm::dvec3 &o = ray.origin, &d = ray.direction;
    double a = d.x * d.x - d.y * d.y + d.z * d.z;
    double b = 2.0 * o.x * d.x - 2.0 * o.y * d.y + 2.0 * o.z * d.z;
    double c = o.x * o.x - o.y * o.y + o.z * o.z;
    if (std::abs(a) < EPS) {
        // ray parallel to one of the cone's halves: a single hit, if any
        if (std::abs(b) >= EPS) {
            double t = -c / b;
            double y = o.y + t * d.y;
            if (cone.minimum < y && y < cone.maximum) xs.emplace_back(t, &self, world_to_object);
        }
    }
    else {
        double disc = b * b - 4 * a * c;
        if (disc >= 0) {
            double sqrtd = std::sqrt(disc);
            clip_to_range((-b - sqrtd) / (2 * a), (-b + sqrtd) / (2 * a), cone.minimum, cone.maximum, self, ray, world_to_object, xs);
        }
    }
    intersect_caps(cone.minimum, cone.maximum, cone.closed, radius, self, ray, world_to_object, xs);
}

namespace {
// Moller-Trumbore; false for rays parallel to the plane or outside the triangle
bool moller_trumbore(const glm::dvec3 &p1, const glm::dvec3 &e1, const glm::dvec3 &e2, const Ray &ray, double &t, double &u, double &v) {
    glm::dvec3 dir_cross_e2 = glm::cross(ray.direction, e2);
    double det = glm::dot(e1, dir_cross_e2);
    if (std::abs(det) < EPS) return false;
    double f = 1.0 / det;
    glm::dvec3 p1_to_origin = ray.origin - p1;
    u = f * glm::dot(p1_to_origin, dir_cross_e2);
    if (u < 0.0 || u > 1.0) return false;
    glm::dvec3 origin_cross_e1 = glm::cross(p1_to_origin, e1);
    v = f * glm::dot(ray.direction, origin_cross_e1);
    if (v < 0.0 || u + v > 1.0) return false;
    t = f * glm::dot(e2, origin_cross_e1);
    return true;
}
}

void local_intersect(const Triangle &tri, const Shape &self, const Ray &ray, const glm::dmat4 &world_to_object, std::vector<Intersection> &xs) {
    double t, u, v;
    if (moller_trumbore(tri.p1, tri.e1, tri.e2, ray, t, u, v)) xs.emplace_back(t, &self, world_to_object, u, v);
}

void local_intersect(const SmoothTriangle &tri, const Shape &self, const Ray &ray, const glm::dmat4 &world_to_object, std::vector<Intersection> &xs) {
    double t, u, v;
    if (moller_trumbore(tri.p1, tri.e1, tri.e2, ray, t, u, v)) xs.emplace_back(t, &self, world_to_object, u, v);
}

glm::dvec3 local_normal_at(const Sphere &, const glm::dvec3 &p, const Intersection &) { return p; }

glm::dvec3 local_normal_at(const Plane &, const glm::dvec3 &, const Intersection &) { return glm::dvec3(0.0, 1.0, 0.0); }

glm::dvec3 local_normal_at(const Cube &, const glm::dvec3 &p, const Intersection &) {
    double maxc = std::max(std::abs(p.x), std::max(std::abs(p.y), std::abs(p.z)));
    if (maxc == std::abs(p.x)) return glm::dvec3(p.x, 0.0, 0.0);
    if (maxc == std::abs(p.y)) return glm::dvec3(0.0, p.y, 0.0);
    return glm::dvec3(0.0, 0.0, p.z);
}

glm::dvec3 local_normal_at(const Cylinder &cyl, const glm::dvec3 &p, const Intersection &) {
    double dist = p.x * p.x + p.z * p.z;
    if (dist < 1.0 && p.y >= cyl.maximum - EPS) return glm::dvec3(0.0, 1.0, 0.0);
    if (dist < 1.0 && p.y <= cyl.minimum + EPS) return glm::dvec3(0.0, -1.0, 0.0);
    return glm::dvec3(p.x, 0.0, p.z);
}

glm::dvec3 local_normal_at(const Cone &cone, const glm::dvec3 &p, const Intersection &) {
    double dist = p.x * p.x + p.z * p.z;
    if (dist < cone.maximum * cone.maximum && p.y >= cone.maximum - EPS) return glm::dvec3(0.0, 1.0, 0.0);
    if (dist < cone.minimum * cone.minimum && p.y <= cone.minimum + EPS) return glm::dvec3(0.0, -1.0, 0.0);
    double y = std::sqrt(dist);
    if (p.y > 0) y = -y;
    return glm::dvec3(p.x, y, p.z);
}

glm::dvec3 local_normal_at(const Triangle &tri, const glm::dvec3 &, const Intersection &) { return tri.normal; }

glm::dvec3 local_normal_at(const SmoothTriangle &tri, const glm::dvec3 &, const Intersection &hit) {
    return tri.n2 * hit.u + tri.n3 * hit.v + tri.n1 * (1.0 - hit.u - hit.v);
}

BoundingBox bounds_of(const Sphere &) { return BoundingBox(glm::dvec3(-1.0), glm::dvec3(1.0)); }

BoundingBox bounds_of(const Plane &) { return BoundingBox(glm::dvec3(-INF, 0.0, -INF), glm::dvec3(INF, 0.0, INF)); }

BoundingBox bounds_of(const Cube &) { return BoundingBox(glm::dvec3(-1.0), glm::dvec3(1.0)); }

BoundingBox bounds_of(const Cylinder &cyl) {
    return BoundingBox(glm::dvec3(-1.0, cyl.minimum, -1.0), glm::dvec3(1.0, cyl.maximum, 1.0));
}

BoundingBox bounds_of(const Cone &cone) {
    double limit = std::max(std::abs(cone.minimum), std::abs(cone.maximum));
    return BoundingBox(glm::dvec3(-limit, cone.minimum, -limit), glm::dvec3(limit, cone.maximum, limit));
}

BoundingBox bounds_of(const Triangle &tri) {
    BoundingBox box;
    box.add(tri.p1);
    box.add(tri.p2);
    box.add(tri.p3);
    return box;
}

BoundingBox bounds_of(const SmoothTriangle &tri) {
    BoundingBox box;
    box.add(tri.p1);
    box.add(tri.p2);
    box.add(tri.p3);
    return box;
}
