#ifndef TRANSFORM_HPP
#define TRANSFORM_HPP

#include <limits>
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtx/string_cast.hpp>

#define EPS 1e-5
#define INF (std::numeric_limits<double>::infinity())

bool approx_equal(double a, double b);
bool approx_equal(const glm::dvec3 &a, const glm::dvec3 &b);
bool approx_equal(const glm::dmat4 &a, const glm::dmat4 &b);

glm::dmat4 translation(double x, double y, double z);
glm::dmat4 scaling(double x, double y, double z);
glm::dmat4 rotation_x(double radians);
glm::dmat4 rotation_y(double radians);
glm::dmat4 rotation_z(double radians);
glm::dmat4 shearing(double xy, double xz, double yx, double yz, double zx, double zy);
// world -> camera, right handed: the camera looks down -z
glm::dmat4 view_transform(const glm::dvec3 &from, const glm::dvec3 &to, const glm::dvec3 &up);

glm::dvec3 transform_point(const glm::dmat4 &m, const glm::dvec3 &p);
glm::dvec3 transform_vector(const glm::dmat4 &m, const glm::dvec3 &v);
bool invertible(const glm::dmat4 &m);

#endif
