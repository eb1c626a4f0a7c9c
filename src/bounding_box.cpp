#include <algorithm>
#include <cmath>

#include "bounding_box.hpp"

BoundingBox::BoundingBox() {}
BoundingBox::BoundingBox(glm::dvec3 mn, glm::dvec3 mx) : min(mn), max(mx) {}

bool BoundingBox::empty() const { return min.x > max.x || min.y > max.y || min.z > max.z; }

void BoundingBox::add(const glm::dvec3 &p) {
    min = glm::min(min, p);
    max = glm::max(max, p);
}

void BoundingBox::add(const BoundingBox &box) {
    if (box.empty()) return;
    add(box.min);
    add(box.max);
}

bool BoundingBox::contains(const glm::dvec3 &p) const {
    return p.x >= min.x && p.x <= max.x &&
           p.y >= min.y && p.y <= max.y &&
           p.z >= min.z && p.z <= max.z;
}

bool BoundingBox::contains(const BoundingBox &box) const {
    if (box.empty()) return true;
    return contains(box.min) && contains(box.max);
}

BoundingBox BoundingBox::transform(const glm::dmat4 &m) const {
    if (empty()) return BoundingBox();
    // per axis extremes of the eight transformed corners; a zero coefficient
    // contributes nothing even when the extent is infinite
    BoundingBox box;
    for (int row = 0; row < 3; ++row) {
        double lo = m[3][row], hi = m[3][row];
        for (int col = 0; col < 3; ++col) {
            double coef = m[col][row];
            if (coef == 0.0) continue;
            double a = coef * min[col], b = coef * max[col];
            lo += std::min(a, b);
            hi += std::max(a, b);
        }
        box.min[row] = lo;
        box.max[row] = hi;
    }
    return box;
}

std::pair<double, double> check_axis(double origin, double direction, double min, double max) {
    if (std::abs(direction) < EPS) {
        if (origin >= min && origin <= max) return {-INF, INF};
        return {INF, -INF};
    }
    double tmin = (min - origin) / direction;
    double tmax = (max - origin) / direction;
    if (tmin > tmax) std::swap(tmin, tmax);
    return {tmin, tmax};
}

bool BoundingBox::intersects(const Ray &ray) const {
    if (empty()) return false;
    auto [xtmin, xtmax] = check_axis(ray.origin.x, ray.direction.x, min.x, max.x);
    auto [ytmin, ytmax] = check_axis(ray.origin.y, ray.direction.y, min.y, max.y);
    auto [ztmin, ztmax] = check_axis(ray.origin.z, ray.direction.z, min.z, max.z);
    double tmin = std::max(xtmin, std::max(ytmin, ztmin));
    double tmax = std::min(xtmax, std::min(ytmax, ztmax));
    return tmin <= tmax;
}

std::pair<BoundingBox, BoundingBox> BoundingBox::split() const {
    glm::dvec3 diff = max - min;
    int axis = (diff.x >= diff.y && diff.x >= diff.z) ? 0 : (diff.y >= diff.z ? 1 : 2);
    if (empty() || !std::isfinite(diff[axis]) || diff[axis] <= 0.0) return {*this, *this};
    double mid = min[axis] + diff[axis] / 2.0;
    glm::dvec3 mid_max = max, mid_min = min;
    mid_max[axis] = mid;
    mid_min[axis] = mid;
    return {BoundingBox(min, mid_max), BoundingBox(mid_min, max)};
}

BoundingBox operator+(const BoundingBox &a, const BoundingBox &b) {
    BoundingBox box = a;
    box.add(b);
    return box;
}

bool operator==(const BoundingBox &a, const BoundingBox &b) {
    if (a.empty() && b.empty()) return true;
    return approx_equal(a.min, b.min) && approx_equal(a.max, b.max);
}
