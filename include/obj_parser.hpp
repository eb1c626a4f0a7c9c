#ifndef OBJ_PARSER_HPP
#define OBJ_PARSER_HPP

#include <istream>
#include <string>
#include <utility>
#include <vector>

#include "shape.hpp"

struct ObjModel {
    std::vector<glm::dvec3> vertices;
    std::vector<glm::dvec3> normals;
    Group default_group;
    // in file order
    std::vector<std::pair<std::string, Group>> named_groups;
    std::size_t ignored_lines = 0;

    BoundingBox vertex_bounds() const;
};

// throws std::runtime_error on malformed numbers or out of range indices
ObjModel parse_obj(std::istream &in, const std::string &name = "<stream>");
ObjModel parse_obj_file(const std::string &filename);
// a single group of all triangles, named groups become child groups
Shape obj_to_group(ObjModel model);

#endif
