#include <stdexcept>

#include "shape.hpp"

void add_child(Group &group, Shape child) {
    group.bounds.add(parent_space_bounds(child));
    group.children.push_back(std::move(child));
}

void recompute_bounds(Group &group) {
    group.bounds = BoundingBox();
    for (auto &child: group.children) group.bounds.add(parent_space_bounds(child));
}

void local_intersect(const Group &group, const Shape &, const Ray &ray, const glm::dmat4 &world_to_object, std::vector<Intersection> &xs) {
    if (!group.bounds.intersects(ray)) return;
    for (auto &child: group.children) intersect(child, ray, world_to_object, xs);
}

glm::dvec3 local_normal_at(const Group &, const glm::dvec3 &, const Intersection &) {
    throw std::logic_error("local_normal_at called on a group; normals come from the leaf hit");
}

BoundingBox bounds_of(const Group &group) { return group.bounds; }

std::pair<std::vector<Shape>, std::vector<Shape>> partition_children(Group &group) {
    std::vector<Shape> left, right;
    auto [left_box, right_box] = group.bounds.split();
    if (left_box == group.bounds || right_box == group.bounds) return {std::move(left), std::move(right)};

    std::vector<Shape> remaining;
    for (auto &child: group.children) {
        BoundingBox box = parent_space_bounds(child);
        if (left_box.contains(box)) left.push_back(std::move(child));
        else if (right_box.contains(box))
            right.push_back(std::move(child));
        else
            remaining.push_back(std::move(child));
    }
    group.children = std::move(remaining);
    return {std::move(left), std::move(right)};
}

void make_subgroup(Group &group, std::vector<Shape> shapes) {
    Group sub;
    for (auto &shape: shapes) add_child(sub, std::move(shape));
    add_child(group, std::move(sub));
}

void divide(Group &group, std::size_t threshold) {
    if (threshold <= group.children.size()) {
        auto [left, right] = partition_children(group);
        if (!left.empty()) make_subgroup(group, std::move(left));
        if (!right.empty()) make_subgroup(group, std::move(right));
    }
    for (auto &child: group.children) divide(child, threshold);
}
