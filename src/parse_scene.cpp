
#include "parse_scene.hpp"
#include "obj_parser.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <stack>
#include <stdexcept>
#include <vector>

namespace {
// shapes collected between beginGroup and endGroup
struct Scope {
    std::vector<Shape> shapes;
    glm::dmat4 group_transform = glm::dmat4(1.0);
    glm::dmat4 saved_transform = glm::dmat4(1.0);
    Material group_material;
};

bool parse_flag(const std::string &s, bool &out) {
    if (s == "closed" || s == "on" || s == "true" || s == "1") out = true;
    else if (s == "open" || s == "off" || s == "false" || s == "0")
        out = false;
    else
        return false;
    return true;
}
}

Scene parse_scene(std::string filename) {
    std::ifstream fin(filename);
    if (!fin) throw std::runtime_error("Error opening file " + filename);
    auto slash = filename.find_last_of('/');
    std::string base_dir = slash == std::string::npos ? "." : filename.substr(0, slash);
    return parse_scene(fin, base_dir, filename);
}

Scene parse_scene(std::istream &fin, const std::string &base_dir, const std::string &name) {
    Scene scene;

    auto string_trim = [](std::string s) -> std::string {
        const auto str_begin = s.find_first_not_of(" \t\r");
        if (str_begin == std::string::npos) return "";
        const auto str_end = s.find_last_not_of(" \t\r");
        return s.substr(str_begin, str_end - str_begin + 1);
    };

    unsigned width = 160, height = 120;
    double fovy = 60.0;
    bool has_camera = false;
    glm::dvec3 from(0.0), to(0.0, 0.0, -1.0), up(0.0, 1.0, 0.0);
    RenderOptions options;

    glm::dmat4 current_transform = glm::dmat4(1.0);
    std::stack<glm::dmat4> transform_stack;
    std::vector<glm::dvec3> vertices;
    std::vector<std::pair<glm::dvec3, glm::dvec3>> vertices_norm;
    Material current_material;
    bool current_shadow = true;
    std::vector<Scope> scopes(1);

    std::size_t line_number = 0;
    auto fail = [&](const std::string &what) {
        throw std::runtime_error(name + ":" + std::to_string(line_number) + ": " + what);
    };
    auto place = [&](Shape shape, const glm::dmat4 &local) {
        set_transform(shape, current_transform * local);
        ShapeBase &base = shape_base(shape);
        base.material = current_material;
        set_casts_shadow(shape, current_shadow);
        scopes.back().shapes.push_back(std::move(shape));
    };
    auto vertex_at = [&](long i) {
        if (i < 0 || static_cast<std::size_t>(i) >= vertices.size()) fail("vertex index " + std::to_string(i) + " out of range");
        return vertices[i];
    };
    auto vertex_norm_at = [&](long i) {
        if (i < 0 || static_cast<std::size_t>(i) >= vertices_norm.size()) fail("vertex normal index " + std::to_string(i) + " out of range");
        return vertices_norm[i];
    };

    for (std::string line; std::getline(fin, line); ) {
        ++line_number;
        auto comment_pos = line.find("#");
        if (comment_pos != std::string::npos) line = line.substr(0, comment_pos);
        line = string_trim(line);
        if (line == "") continue;
        std::istringstream iss(line);
        std::string instruction; iss >> instruction;
        try {
            if (instruction == "size") {
                if (!(iss >> width >> height) || width == 0 || height == 0) fail("size expects two positive integers");
            }
            else if (instruction == "camera") {
                if (!(iss >> from.x >> from.y >> from.z >> to.x >> to.y >> to.z >> up.x >> up.y >> up.z >> fovy)) fail("camera expects 10 numbers");
                has_camera = true;
            }
            else if (instruction == "maxdepth") {
                if (!(iss >> options.max_depth)) fail("maxdepth expects an integer");
            }
            else if (instruction == "threads") {
                if (!(iss >> options.num_threads)) fail("threads expects an integer");
                if (options.num_threads == 0) fail("threads must be greater than zero");
            }
            else if (instruction == "antialias") {
                unsigned samples;
                if (!(iss >> samples)) fail("antialias expects an integer");
                options.aa_samples = aa_samples_from_count(samples);
            }
            else if (instruction == "output") {
                if (!(iss >> scene.output_filename)) fail("output expects a file name");
            }
            else if (instruction == "divide") {
                if (!(iss >> scene.divide_threshold)) fail("divide expects an integer");
            }
            else if (instruction == "translate") {
                glm::dvec3 t;
                if (!(iss >> t.x >> t.y >> t.z)) fail("translate expects 3 numbers");
                current_transform = current_transform * translation(t.x, t.y, t.z);
            }
            else if (instruction == "rotate") {
                glm::dvec3 axis; double angle;
                if (!(iss >> axis.x >> axis.y >> axis.z >> angle)) fail("rotate expects 4 numbers");
                if (glm::length(axis) < EPS) fail("rotate axis must not be zero");
                current_transform = glm::rotate(current_transform, glm::radians(angle), glm::normalize(axis));
            }
            else if (instruction == "scale") {
                glm::dvec3 s;
                if (!(iss >> s.x >> s.y >> s.z)) fail("scale expects 3 numbers");
                current_transform = current_transform * scaling(s.x, s.y, s.z);
            }
            else if (instruction == "shear") {
                double xy, xz, yx, yz, zx, zy;
                if (!(iss >> xy >> xz >> yx >> yz >> zx >> zy)) fail("shear expects 6 numbers");
                current_transform = current_transform * shearing(xy, xz, yx, yz, zx, zy);
            }
            else if (instruction == "pushTransform") {
                transform_stack.push(current_transform);
            }
            else if (instruction == "popTransform") {
                if (transform_stack.empty()) fail("popTransform without pushTransform");
                current_transform = transform_stack.top();
                transform_stack.pop();
            }
            else if (instruction == "color") {
                if (!(iss >> current_material.color.r >> current_material.color.g >> current_material.color.b)) fail("color expects 3 numbers");
            }
            else if (instruction == "ambient") {
                if (!(iss >> current_material.ambient)) fail("ambient expects a number");
            }
            else if (instruction == "diffuse") {
                if (!(iss >> current_material.diffuse)) fail("diffuse expects a number");
            }
            else if (instruction == "specular") {
                if (!(iss >> current_material.specular)) fail("specular expects a number");
            }
            else if (instruction == "shininess") {
                if (!(iss >> current_material.shininess)) fail("shininess expects a number");
            }
            else if (instruction == "reflective") {
                if (!(iss >> current_material.reflective)) fail("reflective expects a number");
            }
            else if (instruction == "transparency") {
                if (!(iss >> current_material.transparency)) fail("transparency expects a number");
            }
            else if (instruction == "refractive") {
                if (!(iss >> current_material.refractive_index)) fail("refractive expects a number");
            }
            else if (instruction == "pattern") {
                std::string kind; glm::dvec3 a, b;
                if (!(iss >> kind >> a.r >> a.g >> a.b >> b.r >> b.g >> b.b)) fail("pattern expects a kind and 6 numbers");
                if (kind == "stripe") current_material.pattern = Pattern(Stripe{a, b});
                else if (kind == "gradient")
                    current_material.pattern = Pattern(Gradient{a, b});
                else if (kind == "ring")
                    current_material.pattern = Pattern(Ring{a, b});
                else if (kind == "checkers")
                    current_material.pattern = Pattern(Checkers{a, b});
                else
                    fail("unknown pattern " + kind);
            }
            else if (instruction == "patternscale") {
                glm::dvec3 s;
                if (!(iss >> s.x >> s.y >> s.z)) fail("patternscale expects 3 numbers");
                if (!current_material.pattern) fail("patternscale without a pattern");
                current_material.pattern->set_transform(scaling(s.x, s.y, s.z));
            }
            else if (instruction == "nopattern") {
                current_material.pattern.reset();
            }
            else if (instruction == "shadow") {
                std::string s;
                if (!(iss >> s) || !parse_flag(s, current_shadow)) fail("shadow expects on or off");
            }
            else if (instruction == "resetMaterial") {
                current_material = Material();
                current_shadow = true;
            }
            else if (instruction == "sphere") {
                glm::dvec3 c; double r;
                if (!(iss >> c.x >> c.y >> c.z >> r)) fail("sphere expects 4 numbers");
                place(Sphere(), translation(c.x, c.y, c.z) * scaling(r, r, r));
            }
            else if (instruction == "plane") {
                place(Plane(), glm::dmat4(1.0));
            }
            else if (instruction == "cube") {
                place(Cube(), glm::dmat4(1.0));
            }
            else if (instruction == "cylinder" || instruction == "cone") {
                double minimum, maximum; std::string c; bool closed;
                if (!(iss >> minimum >> maximum >> c) || !parse_flag(c, closed)) fail(instruction + " expects min max closed|open");
                place(instruction == "cylinder" ? make_cylinder(minimum, maximum, closed) : make_cone(minimum, maximum, closed), glm::dmat4(1.0));
            }
            else if (instruction == "maxverts" || instruction == "maxvertnorms") {
                // Do nothing
            }
            else if (instruction == "vertex") {
                glm::dvec3 v;
                if (!(iss >> v.x >> v.y >> v.z)) fail("vertex expects 3 numbers");
                vertices.push_back(v);
            }
            else if (instruction == "vertexnormal") {
                glm::dvec3 v, n;
                if (!(iss >> v.x >> v.y >> v.z >> n.x >> n.y >> n.z)) fail("vertexnormal expects 6 numbers");
                vertices_norm.push_back({v, n});
            }
            else if (instruction == "tri") {
                long v0, v1, v2;
                if (!(iss >> v0 >> v1 >> v2)) fail("tri expects 3 indices");
                place(Triangle(vertex_at(v0), vertex_at(v1), vertex_at(v2)), glm::dmat4(1.0));
            }
            else if (instruction == "trinormal") {
                long v0, v1, v2;
                if (!(iss >> v0 >> v1 >> v2)) fail("trinormal expects 3 indices");
                auto a = vertex_norm_at(v0), b = vertex_norm_at(v1), c = vertex_norm_at(v2);
                place(SmoothTriangle(a.first, b.first, c.first, a.second, b.second, c.second), glm::dmat4(1.0));
            }
            else if (instruction == "obj") {
                std::string file;
                if (!(iss >> file)) fail("obj expects a file name");
                std::string path = (!file.empty() && file[0] == '/') ? file : base_dir + "/" + file;
                ObjModel model = parse_obj_file(path);
                if (model.ignored_lines > 0) std::cerr << path << ": ignored " << model.ignored_lines << " lines" << std::endl;
                Shape mesh = obj_to_group(std::move(model));
                set_material(mesh, current_material);
                place(std::move(mesh), glm::dmat4(1.0));
            }
            else if (instruction == "beginGroup") {
                Scope scope;
                scope.group_transform = current_transform;
                scope.saved_transform = current_transform;
                scope.group_material = current_material;
                scopes.push_back(std::move(scope));
                current_transform = glm::dmat4(1.0);
            }
            else if (instruction == "endGroup") {
                if (scopes.size() < 2) fail("endGroup without beginGroup");
                Scope scope = std::move(scopes.back());
                scopes.pop_back();
                Shape group = Group();
                set_transform(group, scope.group_transform);
                shape_base(group).material = scope.group_material;
                for (auto &child: scope.shapes) add_child(std::get<Group>(group), std::move(child));
                current_transform = scope.saved_transform;
                scopes.back().shapes.push_back(std::move(group));
            }
            else if (instruction == "csg") {
                std::string op_name; CsgOperation op = CsgOperation::Union;
                if (!(iss >> op_name)) fail("csg expects an operation");
                if (op_name == "union") op = CsgOperation::Union;
                else if (op_name == "intersection")
                    op = CsgOperation::Intersection;
                else if (op_name == "difference")
                    op = CsgOperation::Difference;
                else
                    fail("unknown csg operation " + op_name);
                std::vector<Shape> &shapes = scopes.back().shapes;
                if (shapes.size() < 2) fail("csg needs two shapes");
                Shape right = std::move(shapes.back());
                shapes.pop_back();
                Shape left = std::move(shapes.back());
                shapes.pop_back();
                Shape csg = Csg(op, std::move(left), std::move(right));
                shape_base(csg).material = current_material;
                set_casts_shadow(csg, current_shadow);
                shapes.push_back(std::move(csg));
            }
            else if (instruction == "point") {
                PointLight point;
                if (!(iss >> point.position.x >> point.position.y >> point.position.z >> point.intensity.r >> point.intensity.g >> point.intensity.b))
                    fail("point expects 6 numbers");
                scene.world.lights.push_back(point);
            }
            else {
                std::cerr << name << ":" << line_number << ": Unknown instruction: " << instruction << std::endl;
            }
        }
        catch (const std::invalid_argument &e) {
            fail(e.what());
        }
    }
    if (scopes.size() != 1) throw std::runtime_error(name + ": beginGroup without endGroup");
    scene.world.objects = std::move(scopes.back().shapes);

    scene.camera = Camera(width, height, glm::radians(fovy));
    if (has_camera) scene.camera.set_transform(view_transform(from, to, up));
    scene.camera.options = options;
    return scene;
}
