#include <cmath>

#include "transform.hpp"

bool approx_equal(double a, double b) {
    if (std::isinf(a) || std::isinf(b)) return a == b;
    return std::abs(a - b) < EPS;
}

bool approx_equal(const glm::dvec3 &a, const glm::dvec3 &b) {
    return approx_equal(a.x, b.x) && approx_equal(a.y, b.y) && approx_equal(a.z, b.z);
}

bool approx_equal(const glm::dmat4 &a, const glm::dmat4 &b) {
    for (int col = 0; col < 4; ++col) {
        for (int row = 0; row < 4; ++row) {
            if (!approx_equal(a[col][row], b[col][row])) return false;
        }
    }
    return true;
}

glm::dmat4 translation(double x, double y, double z) {
    return glm::translate(glm::dmat4(1.0), glm::dvec3(x, y, z));
}

glm::dmat4 scaling(double x, double y, double z) {
    return glm::scale(glm::dmat4(1.0), glm::dvec3(x, y, z));
}

glm::dmat4 rotation_x(double radians) {
    return glm::rotate(glm::dmat4(1.0), radians, glm::dvec3(1.0, 0.0, 0.0));
}

glm::dmat4 rotation_y(double radians) {
    return glm::rotate(glm::dmat4(1.0), radians, glm::dvec3(0.0, 1.0, 0.0));
}

glm::dmat4 rotation_z(double radians) {
    return glm::rotate(glm::dmat4(1.0), radians, glm::dvec3(0.0, 0.0, 1.0));
}

glm::dmat4 shearing(double xy, double xz, double yx, double yz, double zx, double zy) {
    // glm is column major: m[col][row]
    glm::dmat4 m(1.0);
    m[1][0] = xy;
    m[2][0] = xz;
    m[0][1] = yx;
    m[2][1] = yz;
    m[0][2] = zx;
    m[1][2] = zy;
    return m;
}

glm::dmat4 view_transform(const glm::dvec3 &from, const glm::dvec3 &to, const glm::dvec3 &up) {
    return glm::lookAtRH(from, to, up);
}

glm::dvec3 transform_point(const glm::dmat4 &m, const glm::dvec3 &p) {
    return glm::dvec3(m * glm::dvec4(p, 1.0));
}

glm::dvec3 transform_vector(const glm::dmat4 &m, const glm::dvec3 &v) {
    return glm::dvec3(m * glm::dvec4(v, 0.0));
}

bool invertible(const glm::dmat4 &m) {
    double det = glm::determinant(m);
    return std::isfinite(det) && std::abs(det) > 1e-12;
}
