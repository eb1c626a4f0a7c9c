#include <fstream>
#include <sstream>
#include <stdexcept>

#include "obj_parser.hpp"

namespace {
struct FaceVertex {
    std::size_t vertex;
    std::size_t normal;
    bool has_normal;
};

[[noreturn]] void parse_error(const std::string &name, std::size_t line_number, const std::string &what) {
    throw std::runtime_error(name + ":" + std::to_string(line_number) + ": " + what);
}

// 1-based or negative (relative to the end) index to 0-based
std::size_t resolve_index(long index, std::size_t count, const std::string &name, std::size_t line_number) {
    long resolved = index > 0 ? index - 1 : static_cast<long>(count) + index;
    if (index == 0 || resolved < 0 || resolved >= static_cast<long>(count))
        parse_error(name, line_number, "index " + std::to_string(index) + " out of range");
    return static_cast<std::size_t>(resolved);
}

long parse_long(const std::string &s, const std::string &name, std::size_t line_number) {
    try {
        std::size_t used;
        long value = std::stol(s, &used);
        if (used != s.size()) parse_error(name, line_number, "malformed index '" + s + "'");
        return value;
    }
    catch (const std::logic_error &) {
        parse_error(name, line_number, "malformed index '" + s + "'");
    }
}

glm::dvec3 read_vec3(std::istringstream &iss, const std::string &name, std::size_t line_number) {
    glm::dvec3 v;
    if (!(iss >> v.x >> v.y >> v.z)) parse_error(name, line_number, "expected three numbers");
    return v;
}
}

BoundingBox ObjModel::vertex_bounds() const {
    BoundingBox box;
    for (auto &v: vertices) box.add(v);
    return box;
}

ObjModel parse_obj(std::istream &in, const std::string &name) {
    ObjModel model;
    Group *current = &model.default_group;
    std::size_t line_number = 0;
    for (std::string line; std::getline(in, line);) {
        ++line_number;
        std::istringstream iss(line);
        std::string kind;
        if (!(iss >> kind)) continue;
        if (kind == "v") {
            model.vertices.push_back(read_vec3(iss, name, line_number));
        }
        else if (kind == "vn") {
            model.normals.push_back(read_vec3(iss, name, line_number));
        }
        else if (kind == "f") {
            std::vector<FaceVertex> face;
            for (std::string item; iss >> item;) {
                FaceVertex fv{0, 0, false};
                std::vector<std::string> parts;
                std::stringstream ss(item);
                for (std::string part; std::getline(ss, part, '/');) parts.push_back(part);
                if (parts.empty()) parse_error(name, line_number, "empty face vertex");
                fv.vertex = resolve_index(parse_long(parts[0], name, line_number), model.vertices.size(), name, line_number);
                if (parts.size() == 3 && !parts[2].empty()) {
                    fv.normal = resolve_index(parse_long(parts[2], name, line_number), model.normals.size(), name, line_number);
                    fv.has_normal = true;
                }
                face.push_back(fv);
            }
            if (face.size() < 3) parse_error(name, line_number, "face needs at least three vertices");
            bool smooth = true;
            for (auto &fv: face) smooth = smooth && fv.has_normal;
            // fan triangulation around the first vertex
            for (std::size_t i = 1; i + 1 < face.size(); ++i) {
                const FaceVertex &a = face[0], &b = face[i], &c = face[i + 1];
                if (smooth)
                    add_child(*current, SmoothTriangle(model.vertices[a.vertex], model.vertices[b.vertex], model.vertices[c.vertex],
                                                       model.normals[a.normal], model.normals[b.normal], model.normals[c.normal]));
                else
                    add_child(*current, Triangle(model.vertices[a.vertex], model.vertices[b.vertex], model.vertices[c.vertex]));
            }
        }
        else if (kind == "g") {
            std::string group_name;
            if (!(iss >> group_name)) parse_error(name, line_number, "group without a name");
            model.named_groups.emplace_back(group_name, Group());
            current = &model.named_groups.back().second;
        }
        else {
            ++model.ignored_lines;
        }
    }
    return model;
}

ObjModel parse_obj_file(const std::string &filename) {
    std::ifstream fin(filename);
    if (!fin) throw std::runtime_error("Error opening file " + filename);
    return parse_obj(fin, filename);
}

Shape obj_to_group(ObjModel model) {
    if (model.named_groups.empty()) return std::move(model.default_group);
    Group group;
    for (auto &child: model.default_group.children) add_child(group, std::move(child));
    for (auto &named: model.named_groups) {
        if (!named.second.children.empty()) add_child(group, std::move(named.second));
    }
    return group;
}
