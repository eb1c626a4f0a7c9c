#include "image.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>

#define PPM_LINE_LENGTH 70

uint8_t to_byte(double c) {
    c = std::clamp(c, 0.0, 1.0);
    return static_cast<uint8_t>(std::lround(c * 255.0));
}

Image::Image() {}

Image::Image(int w, int h) {
    set_size(w, h);
}

void Image::set_size(int w, int h) {
    this->width = w;
    this->height = h;
    data.assign(static_cast<size_t>(w) * h, glm::dvec3(0.0));
}

glm::dvec3 Image::get(int x, int y) const {
    return data[y * width + x];
}

void Image::set(int x, int y, glm::dvec3 color) {
    data[y * width + x] = color;
}

bool Image::dumppng(const std::string &filename) const {
    FILE *fp = fopen(filename.c_str(), "wb");
    if (!fp) {
        std::cerr << "Cannot open file for writing: " << filename << std::endl;
        return false;
    }
    png_structp png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING, NULL, NULL, NULL);
    if (!png_ptr) {
        std::cerr << "Cannot create PNG write structure" << std::endl;
        fclose(fp);
        return false;
    }
    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr) {
        std::cerr << "Cannot create PNG info structure" << std::endl;
        png_destroy_write_struct(&png_ptr, (png_infopp)NULL);
        fclose(fp);
        return false;
    }
    std::vector<png_byte> row(width * 3);
    if (setjmp(png_jmpbuf(png_ptr))) {
        std::cerr << "Error during PNG creation" << std::endl;
        png_destroy_write_struct(&png_ptr, &info_ptr);
        fclose(fp);
        return false;
    }
    png_init_io(png_ptr, fp);
    png_set_IHDR(png_ptr, info_ptr, width, height,
                 8, PNG_COLOR_TYPE_RGB, PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);

    png_write_info(png_ptr, info_ptr);
    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width; x++) {
            glm::dvec3 color = get(x, y);
            int ti = x * 3;
            row[ti] = to_byte(color.r);
            row[ti + 1] = to_byte(color.g);
            row[ti + 2] = to_byte(color.b);
        }
        png_write_row(png_ptr, row.data());
    }
    png_write_end(png_ptr, NULL);
    png_destroy_write_struct(&png_ptr, &info_ptr);
    fclose(fp);
    return true;
}

std::string Image::to_ppm() const {
    std::ostringstream out;
    out << "P3\n" << width << " " << height << "\n255\n";
    for (int y = 0; y < height; y++) {
        std::string line;
        auto emit = [&](uint8_t value) {
            std::string token = std::to_string(value);
            if (!line.empty() && line.size() + 1 + token.size() > PPM_LINE_LENGTH) {
                out << line << "\n";
                line.clear();
            }
            if (!line.empty()) line += " ";
            line += token;
        };
        for (int x = 0; x < width; x++) {
            glm::dvec3 color = get(x, y);
            emit(to_byte(color.r));
            emit(to_byte(color.g));
            emit(to_byte(color.b));
        }
        out << line << "\n";
    }
    return out.str();
}

bool Image::dumpppm(const std::string &filename) const {
    std::ofstream file(filename);
    if (!file) {
        std::cerr << "Cannot open file for writing: " << filename << std::endl;
        return false;
    }
    file << to_ppm();
    return file.good();
}
