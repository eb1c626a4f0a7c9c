#include <cstdio>
#include <fstream>
#include <sstream>

#include "image.hpp"
#include "test_helpers.hpp"

namespace {
std::vector<std::string> lines_of(const std::string &s) {
    std::vector<std::string> lines;
    std::istringstream iss(s);
    for (std::string line; std::getline(iss, line);) lines.push_back(line);
    return lines;
}
}

TEST(Image, StartsBlack) {
    Image img(10, 20);
    EXPECT_EQ(img.width, 10);
    EXPECT_EQ(img.height, 20);
    ASSERT_EQ(img.data.size(), 200u);
    for (auto &c: img.data) EXPECT_VEC_EQ(c, glm::dvec3(0));
}

TEST(Image, SetAndGetByColumnAndRow) {
    Image img(10, 20);
    img.set(2, 3, glm::dvec3(1, 0, 0));
    EXPECT_VEC_EQ(img.get(2, 3), glm::dvec3(1, 0, 0));
    EXPECT_VEC_EQ(img.data[3 * 10 + 2], glm::dvec3(1, 0, 0));
    EXPECT_VEC_EQ(img.get(3, 2), glm::dvec3(0));
}

TEST(Image, ToByteClampsAndRounds) {
    EXPECT_EQ(to_byte(-0.5), 0);
    EXPECT_EQ(to_byte(0.0), 0);
    EXPECT_EQ(to_byte(0.5), 128);
    EXPECT_EQ(to_byte(1.0), 255);
    EXPECT_EQ(to_byte(1.5), 255);
}

TEST(Image, PpmHeaderAndPixels) {
    Image img(5, 3);
    img.set(0, 0, glm::dvec3(1.5, 0, 0));
    img.set(2, 1, glm::dvec3(0, 0.5, 0));
    img.set(4, 2, glm::dvec3(-0.5, 0, 1));
    auto lines = lines_of(img.to_ppm());
    ASSERT_EQ(lines.size(), 6u);
    EXPECT_EQ(lines[0], "P3");
    EXPECT_EQ(lines[1], "5 3");
    EXPECT_EQ(lines[2], "255");
    EXPECT_EQ(lines[3], "255 0 0 0 0 0 0 0 0 0 0 0 0 0 0");
    EXPECT_EQ(lines[4], "0 0 0 0 0 0 0 128 0 0 0 0 0 0 0");
    EXPECT_EQ(lines[5], "0 0 0 0 0 0 0 0 0 0 0 0 0 0 255");
}

TEST(Image, PpmWrapsLongLines) {
    Image img(10, 2);
    for (auto &c: img.data) c = glm::dvec3(1, 0.8, 0.6);
    auto lines = lines_of(img.to_ppm());
    ASSERT_EQ(lines.size(), 7u);
    EXPECT_EQ(lines[3], "255 204 153 255 204 153 255 204 153 255 204 153 255 204 153 255 204");
    EXPECT_EQ(lines[4], "153 255 204 153 255 204 153 255 204 153 255 204 153");
    EXPECT_EQ(lines[5], lines[3]);
    EXPECT_EQ(lines[6], lines[4]);
    for (auto &line: lines) EXPECT_LE(line.size(), 70u);
}

TEST(Image, PpmEndsWithNewline) {
    Image img(5, 3);
    std::string ppm = img.to_ppm();
    ASSERT_FALSE(ppm.empty());
    EXPECT_EQ(ppm.back(), '\n');
}

TEST(Image, DumpPng) {
    Image img(4, 3);
    img.set(1, 1, glm::dvec3(1, 0.5, 0));
    std::string path = testing::TempDir() + "whitted_image_test.png";
    ASSERT_TRUE(img.dumppng(path));
    std::ifstream in(path, std::ios::binary);
    char signature[8] = {};
    in.read(signature, 8);
    EXPECT_EQ(std::string(signature + 1, 3), "PNG");
    std::remove(path.c_str());
}

TEST(Image, DumpPpm) {
    Image img(2, 2);
    std::string path = testing::TempDir() + "whitted_image_test.ppm";
    ASSERT_TRUE(img.dumpppm(path));
    std::ifstream in(path);
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_EQ(contents.str(), img.to_ppm());
    std::remove(path.c_str());
}

TEST(Image, UnwritablePathFails) {
    Image img(2, 2);
    EXPECT_FALSE(img.dumppng("/nonexistent-dir/out.png"));
    EXPECT_FALSE(img.dumpppm("/nonexistent-dir/out.ppm"));
}
