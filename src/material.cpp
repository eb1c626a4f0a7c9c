#include <cmath>
#include <stdexcept>

#include "material.hpp"

namespace {
bool is_even(double v) { return static_cast<long long>(std::floor(v)) % 2 == 0; }
}

Pattern::Pattern() : kind(Stripe{glm::dvec3(1.0), glm::dvec3(0.0)}) {}
Pattern::Pattern(PatternKind k) : kind(k) {}

void Pattern::set_transform(const glm::dmat4 &m) {
    if (!invertible(m)) throw std::invalid_argument("pattern transform is not invertible");
    transform = m;
    inverse = glm::inverse(m);
}

Material glass_material() {
    Material m;
    m.transparency = 1.0;
    m.refractive_index = 1.5;
    return m;
}

glm::dvec3 pattern_at(const Pattern &pattern, const glm::dvec3 &p) {
    if (auto stripe = std::get_if<Stripe>(&pattern.kind)) return is_even(p.x) ? stripe->a : stripe->b;
    if (auto gradient = std::get_if<Gradient>(&pattern.kind))
        return gradient->a + (gradient->b - gradient->a) * (p.x - std::floor(p.x));
    if (auto ring = std::get_if<Ring>(&pattern.kind)) return is_even(std::sqrt(p.x * p.x + p.z * p.z)) ? ring->a : ring->b;
    const Checkers &checkers = std::get<Checkers>(pattern.kind);
    double sum = std::floor(p.x) + std::floor(p.y) + std::floor(p.z);
    return is_even(sum) ? checkers.a : checkers.b;
}

glm::dvec3 pattern_at_object(const Pattern &pattern, const glm::dmat4 &world_to_object, const glm::dvec3 &world_point) {
    glm::dvec3 object_point = transform_point(world_to_object, world_point);
    glm::dvec3 pattern_point = transform_point(pattern.inverse, object_point);
    return pattern_at(pattern, pattern_point);
}

glm::dvec3 lighting(const Material &material, const glm::dmat4 &world_to_object, const PointLight &light, const glm::dvec3 &point,
                    const glm::dvec3 &eyev, const glm::dvec3 &normalv, bool in_shadow) {
    glm::dvec3 color = material.pattern ? pattern_at_object(*material.pattern, world_to_object, point) : material.color;
    glm::dvec3 effective_color = color * light.intensity;
    glm::dvec3 ambient = effective_color * material.ambient;
    if (in_shadow) return ambient;

    glm::dvec3 lightv = glm::normalize(light.position - point);
    double light_dot_normal = glm::dot(lightv, normalv);
    if (light_dot_normal < 0) return ambient;

    glm::dvec3 diffuse = effective_color * material.diffuse * light_dot_normal;
    glm::dvec3 reflectv = glm::reflect(-lightv, normalv);
    double reflect_dot_eye = glm::dot(reflectv, eyev);
    if (reflect_dot_eye <= 0) return ambient + diffuse;

    double factor = std::pow(reflect_dot_eye, material.shininess);
    return ambient + diffuse + light.intensity * material.specular * factor;
}
