#ifndef MATERIAL_HPP
#define MATERIAL_HPP

#include <optional>
#include <variant>

#include "transform.hpp"

struct Stripe {
    glm::dvec3 a, b;
};

struct Gradient {
    glm::dvec3 a, b;
};

struct Ring {
    glm::dvec3 a, b;
};

struct Checkers {
    glm::dvec3 a, b;
};

using PatternKind = std::variant<Stripe, Gradient, Ring, Checkers>;

struct Pattern {
    PatternKind kind;
    glm::dmat4 transform = glm::dmat4(1.0);
    glm::dmat4 inverse = glm::dmat4(1.0);
    Pattern();
    Pattern(PatternKind kind);
    void set_transform(const glm::dmat4 &m);
};

struct Material {
    glm::dvec3 color = glm::dvec3(1.0);
    std::optional<Pattern> pattern;
    double ambient = 0.1;
    double diffuse = 0.9;
    double specular = 0.9;
    double shininess = 200.0;
    double reflective = 0.0;
    double transparency = 0.0;
    double refractive_index = 1.0;
};

Material glass_material();

struct PointLight {
    glm::dvec3 position = glm::dvec3(0.0);
    glm::dvec3 intensity = glm::dvec3(1.0);
};

glm::dvec3 pattern_at(const Pattern &pattern, const glm::dvec3 &pattern_point);
glm::dvec3 pattern_at_object(const Pattern &pattern, const glm::dmat4 &world_to_object, const glm::dvec3 &world_point);
glm::dvec3 lighting(const Material &material, const glm::dmat4 &world_to_object, const PointLight &light, const glm::dvec3 &point,
                    const glm::dvec3 &eyev, const glm::dvec3 &normalv, bool in_shadow);

#endif
