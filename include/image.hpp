#ifndef IMAGE_HPP
#define IMAGE_HPP
#include <png.h>
#include <cstdint>
#include <string>
#include <vector>

#include "transform.hpp"

// color channel in [0, 1] to 0..255, clamped and rounded
uint8_t to_byte(double c);

struct Image {
    int width = 0, height = 0;
    std::vector<glm::dvec3> data;
    Image();
    Image(int w, int h);
    void set_size(int w, int h);
    // x is the column, y the row from the top
    glm::dvec3 get(int x, int y) const;
    void set(int x, int y, glm::dvec3 color);
    bool dumppng(const std::string &filename) const;
    std::string to_ppm() const;
    bool dumpppm(const std::string &filename) const;
};
#endif
