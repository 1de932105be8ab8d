/**
 * @file test_bitmatrix.cpp
 * @brief Unit tests for BitMatrix class.
 */

#include <bitgrid/bitmatrix.hpp>

#include <catch2/catch.hpp>

#include <random>

using namespace bitgrid;

namespace {

BitMatrix make_matrix(std::size_t width, std::size_t height) {
    BitMatrix matrix;
    REQUIRE(BitMatrix::create(width, height, matrix) == Error::Ok);
    return matrix;
}

BitMatrix parse_or_fail(const char* text, const char* set_token, const char* unset_token) {
    BitMatrix matrix;
    REQUIRE(BitMatrix::parse(text, set_token, unset_token, matrix) == Error::Ok);
    return matrix;
}

const std::size_t ROTATE_POINTS[] = {1, 2, 2, 0, 3, 1};

BitMatrix rotate_input(std::size_t width, std::size_t height) {
    BitMatrix matrix = make_matrix(width, height);
    for (std::size_t i = 0; i < 6; i += 2) {
        matrix.set(ROTATE_POINTS[i], ROTATE_POINTS[i + 1]);
    }
    return matrix;
}

BitMatrix rotate_expected(std::size_t width, std::size_t height) {
    BitMatrix matrix = make_matrix(width, height);
    for (std::size_t i = 0; i < 6; i += 2) {
        matrix.set(width - 1 - ROTATE_POINTS[i], height - 1 - ROTATE_POINTS[i + 1]);
    }
    return matrix;
}

BitMatrix random_matrix(std::size_t width, std::size_t height, std::uint32_t seed) {
    std::mt19937 rng(seed);
    BitMatrix matrix = make_matrix(width, height);
    for (std::size_t y = 0; y < height; ++y) {
        for (std::size_t x = 0; x < width; ++x) {
            if ((rng() & 1U) != 0) {
                matrix.set(x, y);
            }
        }
    }
    return matrix;
}

void check_xor(const BitMatrix& data, const BitMatrix& flip, const BitMatrix& expected) {
    BitMatrix matrix = data.clone();
    REQUIRE(matrix.xor_with(flip) == Error::Ok);
    REQUIRE(matrix == expected);
}

} // namespace

TEST_CASE("BitMatrix construction", "[bitmatrix]") {
    SECTION("square") {
        BitMatrix matrix;
        REQUIRE(BitMatrix::create_square(33, matrix) == Error::Ok);
        REQUIRE(matrix.width() == 33);
        REQUIRE(matrix.height() == 33);
        REQUIRE(matrix.row_size() == 2);
    }

    SECTION("rectangular") {
        BitMatrix matrix = make_matrix(75, 20);
        REQUIRE(matrix.width() == 75);
        REQUIRE(matrix.height() == 20);
        REQUIRE(matrix.row_size() == 3);
    }

    SECTION("zero dimensions are rejected") {
        BitMatrix matrix;
        REQUIRE(BitMatrix::create(0, 5, matrix) == Error::InvalidDimension);
        REQUIRE(BitMatrix::create(5, 0, matrix) == Error::InvalidDimension);
        REQUIRE(BitMatrix::create_square(0, matrix) == Error::InvalidDimension);
        REQUIRE(matrix.width() == 0);
    }
}

TEST_CASE("BitMatrix get and set", "[bitmatrix]") {
    BitMatrix matrix = make_matrix(33, 33);
    for (std::size_t y = 0; y < 33; ++y) {
        for (std::size_t x = 0; x < 33; ++x) {
            if (((y * x) % 3) == 0) {
                matrix.set(x, y);
            }
        }
    }
    for (std::size_t y = 0; y < 33; ++y) {
        for (std::size_t x = 0; x < 33; ++x) {
            REQUIRE(matrix.get(x, y) == (((y * x) % 3) == 0));
        }
    }
}

TEST_CASE("BitMatrix set, unset and flip", "[bitmatrix]") {
    BitMatrix matrix = make_matrix(75, 20);
    matrix.set(10, 0);
    matrix.set(11, 1);
    matrix.set(50, 2);
    matrix.set(51, 3);
    matrix.flip(74, 4);
    matrix.flip(0, 5);

    REQUIRE(matrix.get(10, 0));
    REQUIRE(matrix.get(11, 1));
    REQUIRE(matrix.get(50, 2));
    REQUIRE(matrix.get(51, 3));
    REQUIRE(matrix.get(74, 4));
    REQUIRE(matrix.get(0, 5));

    matrix.flip(50, 2);
    matrix.flip(51, 3);
    REQUIRE_FALSE(matrix.get(50, 2));
    REQUIRE_FALSE(matrix.get(51, 3));

    SECTION("unset is idempotent") {
        BitMatrix empty = make_matrix(3, 3);
        BitMatrix other = empty.clone();
        other.set(1, 1);
        REQUIRE(other != empty);
        other.unset(1, 1);
        REQUIRE(other == empty);
        other.unset(1, 1);
        REQUIRE(other == empty);
    }
}

TEST_CASE("BitMatrix set_region", "[bitmatrix]") {
    SECTION("square region") {
        BitMatrix matrix = make_matrix(5, 5);
        REQUIRE(matrix.set_region(1, 1, 3, 3) == Error::Ok);
        for (std::size_t y = 0; y < 5; ++y) {
            for (std::size_t x = 0; x < 5; ++x) {
                REQUIRE(matrix.get(x, y) == (y >= 1 && y <= 3 && x >= 1 && x <= 3));
            }
        }
    }

    SECTION("region spanning several words") {
        BitMatrix matrix = make_matrix(320, 240);
        REQUIRE(matrix.set_region(105, 22, 80, 12) == Error::Ok);
        for (std::size_t y = 0; y < 240; ++y) {
            for (std::size_t x = 0; x < 320; ++x) {
                REQUIRE(matrix.get(x, y) == (y >= 22 && y < 34 && x >= 105 && x < 185));
            }
        }
    }

    SECTION("region touching the far edges") {
        BitMatrix matrix = make_matrix(33, 2);
        REQUIRE(matrix.set_region(31, 1, 2, 1) == Error::Ok);
        REQUIRE(matrix.get(31, 1));
        REQUIRE(matrix.get(32, 1));
        REQUIRE_FALSE(matrix.get(30, 1));
        REQUIRE_FALSE(matrix.get(31, 0));
    }

    SECTION("invalid regions") {
        BitMatrix matrix = make_matrix(5, 5);
        REQUIRE(matrix.set_region(0, 0, 0, 1) == Error::InvalidDimension);
        REQUIRE(matrix.set_region(0, 0, 1, 0) == Error::InvalidDimension);
        REQUIRE(matrix.set_region(3, 0, 3, 1) == Error::RegionOutOfBounds);
        REQUIRE(matrix.set_region(0, 4, 1, 2) == Error::RegionOutOfBounds);
        REQUIRE(matrix.set_region(6, 0, 1, 1) == Error::RegionOutOfBounds);
        REQUIRE(matrix == make_matrix(5, 5));
    }
}

TEST_CASE("BitMatrix clear", "[bitmatrix]") {
    BitMatrix matrix = make_matrix(40, 3);
    REQUIRE(matrix.set_region(0, 0, 40, 3) == Error::Ok);
    matrix.clear();
    REQUIRE(matrix == make_matrix(40, 3));
}

TEST_CASE("BitMatrix enclosing rectangle", "[bitmatrix]") {
    BitMatrix matrix = make_matrix(5, 5);
    Rectangle rect;
    REQUIRE_FALSE(matrix.get_enclosing_rectangle(rect));

    REQUIRE(matrix.set_region(1, 1, 1, 1) == Error::Ok);
    REQUIRE(matrix.get_enclosing_rectangle(rect));
    REQUIRE(rect == Rectangle{1, 1, 1, 1});

    REQUIRE(matrix.set_region(1, 1, 3, 2) == Error::Ok);
    REQUIRE(matrix.get_enclosing_rectangle(rect));
    REQUIRE(rect == Rectangle{1, 1, 3, 2});

    REQUIRE(matrix.set_region(0, 0, 5, 5) == Error::Ok);
    REQUIRE(matrix.get_enclosing_rectangle(rect));
    REQUIRE(rect == Rectangle{0, 0, 5, 5});
}

TEST_CASE("BitMatrix enclosing rectangle across words", "[bitmatrix]") {
    BitMatrix matrix = make_matrix(100, 10);
    matrix.set(70, 2);
    matrix.set(31, 7);
    matrix.set(32, 4);

    Rectangle rect;
    REQUIRE(matrix.get_enclosing_rectangle(rect));
    REQUIRE(rect == Rectangle{31, 2, 40, 6});
}

TEST_CASE("BitMatrix on-bits", "[bitmatrix]") {
    BitMatrix matrix = make_matrix(5, 5);
    Point point;
    REQUIRE_FALSE(matrix.get_top_left_on_bit(point));
    REQUIRE_FALSE(matrix.get_bottom_right_on_bit(point));

    REQUIRE(matrix.set_region(1, 1, 1, 1) == Error::Ok);
    REQUIRE(matrix.get_top_left_on_bit(point));
    REQUIRE(point == Point{1, 1});
    REQUIRE(matrix.get_bottom_right_on_bit(point));
    REQUIRE(point == Point{1, 1});

    REQUIRE(matrix.set_region(1, 1, 3, 2) == Error::Ok);
    REQUIRE(matrix.get_top_left_on_bit(point));
    REQUIRE(point == Point{1, 1});
    REQUIRE(matrix.get_bottom_right_on_bit(point));
    REQUIRE(point == Point{3, 2});

    REQUIRE(matrix.set_region(0, 0, 5, 5) == Error::Ok);
    REQUIRE(matrix.get_top_left_on_bit(point));
    REQUIRE(point == Point{0, 0});
    REQUIRE(matrix.get_bottom_right_on_bit(point));
    REQUIRE(point == Point{4, 4});
}

TEST_CASE("BitMatrix region bounds and on-bits agree", "[bitmatrix]") {
    BitMatrix matrix = make_matrix(5, 5);
    REQUIRE(matrix.set_region(1, 1, 3, 3) == Error::Ok);

    Rectangle rect;
    REQUIRE(matrix.get_enclosing_rectangle(rect));
    REQUIRE(rect == Rectangle{1, 1, 3, 3});

    Point point;
    REQUIRE(matrix.get_top_left_on_bit(point));
    REQUIRE(point == Point{1, 1});
    REQUIRE(matrix.get_bottom_right_on_bit(point));
    REQUIRE(point == Point{3, 3});
}

TEST_CASE("BitMatrix get_row", "[bitmatrix]") {
    BitMatrix matrix = make_matrix(102, 5);
    for (std::size_t x = 0; x < 102; ++x) {
        if ((x & 0x03U) == 0) {
            matrix.set(x, 2);
        }
    }

    BitArray array = matrix.get_row(2);
    REQUIRE(array.size() == 102);

    BitArray array2(60);
    matrix.get_row(2, array2);
    REQUIRE(array2.size() == 102);

    BitArray array3(200);
    array3.set(150);
    const BitArray& result3 = matrix.get_row(2, array3);
    REQUIRE(&result3 == &array3);
    REQUIRE(array3.size() == 200);
    REQUIRE_FALSE(array3.get(150));

    for (std::size_t x = 0; x < 102; ++x) {
        bool on = (x & 0x03U) == 0;
        REQUIRE(array.get(x) == on);
        REQUIRE(array2.get(x) == on);
        REQUIRE(array3.get(x) == on);
    }
}

TEST_CASE("BitMatrix set_row", "[bitmatrix]") {
    BitMatrix matrix = make_matrix(40, 3);

    SECTION("copies a row of the same width") {
        BitArray row(40);
        row.set(0);
        row.set(39);
        REQUIRE(matrix.set_row(1, row) == Error::Ok);
        REQUIRE(matrix.get(0, 1));
        REQUIRE(matrix.get(39, 1));
        REQUIRE(matrix.get_row(1) == row);
    }

    SECTION("bits beyond the width are dropped") {
        BitArray row(64);
        REQUIRE(row.set_range(0, 64) == Error::Ok);
        REQUIRE(matrix.set_row(0, row) == Error::Ok);

        BitMatrix expected = make_matrix(40, 3);
        REQUIRE(expected.set_region(0, 0, 40, 1) == Error::Ok);
        REQUIRE(matrix == expected);
    }

    SECTION("short rows are rejected") {
        BitArray row(39);
        REQUIRE(row.set_range(0, 39) == Error::Ok);
        REQUIRE(matrix.set_row(0, row) == Error::DimensionMismatch);
        REQUIRE(matrix == make_matrix(40, 3));
    }
}

TEST_CASE("BitMatrix rotate180 simple", "[bitmatrix]") {
    BitMatrix matrix = make_matrix(3, 3);
    matrix.set(0, 0);
    matrix.set(0, 1);
    matrix.set(1, 2);
    matrix.set(2, 1);

    REQUIRE(matrix.rotate180() == Error::Ok);

    REQUIRE(matrix.get(2, 2));
    REQUIRE(matrix.get(2, 1));
    REQUIRE(matrix.get(1, 0));
    REQUIRE(matrix.get(0, 1));
}

TEST_CASE("BitMatrix rotate180", "[bitmatrix]") {
    const std::size_t sizes[][2] = {{7, 4}, {7, 5}, {8, 4}, {8, 5}, {33, 7}, {64, 6}, {65, 3}};
    for (const auto& size : sizes) {
        std::size_t width = size[0];
        std::size_t height = size[1];
        INFO(width << "x" << height);

        BitMatrix input = rotate_input(width, height);
        REQUIRE(input.rotate180() == Error::Ok);
        REQUIRE(input == rotate_expected(width, height));
    }
}

TEST_CASE("BitMatrix rotate180 is an involution", "[bitmatrix]") {
    const std::size_t sizes[][2] = {{1, 1}, {5, 4}, {32, 3}, {33, 33}, {95, 10}, {100, 1}};
    std::uint32_t seed = 1;
    for (const auto& size : sizes) {
        INFO(size[0] << "x" << size[1]);
        BitMatrix original = random_matrix(size[0], size[1], seed++);
        BitMatrix matrix = original.clone();
        REQUIRE(matrix.rotate180() == Error::Ok);
        REQUIRE(matrix.rotate180() == Error::Ok);
        REQUIRE(matrix == original);
    }
}

TEST_CASE("BitMatrix xor_with", "[bitmatrix]") {
    BitMatrix empty = make_matrix(3, 3);
    BitMatrix full = make_matrix(3, 3);
    REQUIRE(full.set_region(0, 0, 3, 3) == Error::Ok);
    BitMatrix center = make_matrix(3, 3);
    REQUIRE(center.set_region(1, 1, 1, 1) == Error::Ok);
    BitMatrix inverted_center = full.clone();
    inverted_center.unset(1, 1);
    BitMatrix bad = make_matrix(4, 4);

    check_xor(empty, empty, empty);
    check_xor(empty, center, center);
    check_xor(empty, full, full);

    check_xor(center, empty, center);
    check_xor(center, center, empty);
    check_xor(center, full, inverted_center);

    check_xor(inverted_center, empty, inverted_center);
    check_xor(inverted_center, center, full);
    check_xor(inverted_center, full, center);

    check_xor(full, empty, full);
    check_xor(full, center, inverted_center);
    check_xor(full, full, empty);

    BitMatrix copy = empty.clone();
    REQUIRE(copy.xor_with(bad) == Error::DimensionMismatch);
    copy = bad.clone();
    REQUIRE(copy.xor_with(empty) == Error::DimensionMismatch);
}

TEST_CASE("BitMatrix xor_with is self-inverse", "[bitmatrix]") {
    BitMatrix data = random_matrix(70, 9, 7);
    BitMatrix mask = random_matrix(70, 9, 8);

    BitMatrix matrix = data.clone();
    REQUIRE(matrix.xor_with(mask) == Error::Ok);
    REQUIRE(matrix != data);
    REQUIRE(matrix.xor_with(mask) == Error::Ok);
    REQUIRE(matrix == data);

    BitMatrix self = data.clone();
    REQUIRE(self.xor_with(data) == Error::Ok);
    REQUIRE(self == make_matrix(70, 9));
}

TEST_CASE("BitMatrix parse", "[bitmatrix]") {
    BitMatrix empty = make_matrix(3, 3);
    BitMatrix full = make_matrix(3, 3);
    REQUIRE(full.set_region(0, 0, 3, 3) == Error::Ok);
    BitMatrix center = make_matrix(3, 3);
    REQUIRE(center.set_region(1, 1, 1, 1) == Error::Ok);
    BitMatrix empty24 = make_matrix(2, 4);

    REQUIRE(parse_or_fail("   \n   \n   \n", "x", " ") == empty);
    REQUIRE(parse_or_fail("   \n   \r\r\n   \n\r", "x", " ") == empty);
    REQUIRE(parse_or_fail("   \n   \n   ", "x", " ") == empty);
    REQUIRE(parse_or_fail("xxx\nxxx\nxxx\n", "x", " ") == full);
    REQUIRE(parse_or_fail("   \n x \n   \n", "x", " ") == center);
    REQUIRE(parse_or_fail("      \n  x   \n      \n", "x ", "  ") == center);
    REQUIRE(parse_or_fail("  \n  \n  \n  \n", "x", " ") == empty24);
    REQUIRE(parse_or_fail(center.to_string("x", ".").c_str(), "x", ".") == center);
}

TEST_CASE("BitMatrix parse errors", "[bitmatrix]") {
    BitMatrix matrix;

    SECTION("unknown token") {
        REQUIRE(BitMatrix::parse("   \n xy\n   \n", "x", " ", matrix) == Error::ParseError);
    }

    SECTION("row length mismatch") {
        REQUIRE(BitMatrix::parse("xxx\nxx\nxxx\n", "x", " ", matrix) == Error::ParseError);
        REQUIRE(BitMatrix::parse("xxx\nxxx\nxxxx", "x", " ", matrix) == Error::ParseError);
    }

    SECTION("no rows") {
        REQUIRE(BitMatrix::parse("\n", "x", " ", matrix) == Error::ParseError);
        REQUIRE(BitMatrix::parse("", "x", " ", matrix) == Error::ParseError);
    }

    SECTION("empty tokens") {
        REQUIRE(BitMatrix::parse("xx\n", "", " ", matrix) == Error::ParseError);
        REQUIRE(BitMatrix::parse("xx\n", "x", "", matrix) == Error::ParseError);
    }

    REQUIRE(matrix.width() == 0);
}

TEST_CASE("BitMatrix to_string", "[bitmatrix]") {
    BitMatrix matrix = make_matrix(2, 2);
    matrix.set(0, 0);
    matrix.set(1, 1);

    REQUIRE(matrix.to_string() == "X   \n  X \n");
    REQUIRE(matrix.to_string("1", "0") == "10\n01\n");
    REQUIRE(matrix.to_string("#", "-", "|") == "#-|-#|");
}

TEST_CASE("BitMatrix text round trip", "[bitmatrix]") {
    const char* tokens[][2] = {{"X ", "  "}, {"1", "0"}, {"#", "."}, {"on", "off"}};
    std::uint32_t seed = 100;
    for (const auto& pair : tokens) {
        BitMatrix original = random_matrix(37, 6, seed++);
        std::string text = original.to_string(pair[0], pair[1]);

        BitMatrix parsed;
        REQUIRE(BitMatrix::parse(text, pair[0], pair[1], parsed) == Error::Ok);
        REQUIRE(parsed == original);
    }
}

TEST_CASE("BitMatrix parse_boolean_grid", "[bitmatrix]") {
    BitMatrix matrix;

    SECTION("rectangular image") {
        std::vector<std::vector<bool>> image = {
            {true, false, false},
            {false, true, false},
        };
        REQUIRE(BitMatrix::parse_boolean_grid(image, matrix) == Error::Ok);
        REQUIRE(matrix.width() == 3);
        REQUIRE(matrix.height() == 2);
        REQUIRE(matrix.get(0, 0));
        REQUIRE(matrix.get(1, 1));
        REQUIRE_FALSE(matrix.get(2, 1));
    }

    SECTION("empty image") {
        std::vector<std::vector<bool>> image;
        REQUIRE(BitMatrix::parse_boolean_grid(image, matrix) == Error::InvalidDimension);
        image.push_back({});
        REQUIRE(BitMatrix::parse_boolean_grid(image, matrix) == Error::InvalidDimension);
    }

    SECTION("ragged image") {
        std::vector<std::vector<bool>> image = {{true, true}, {true}};
        REQUIRE(BitMatrix::parse_boolean_grid(image, matrix) == Error::DimensionMismatch);
    }
}

TEST_CASE("BitMatrix clone is independent", "[bitmatrix]") {
    BitMatrix matrix = make_matrix(10, 10);
    BitMatrix copy = matrix.clone();
    copy.set(3, 4);
    REQUIRE_FALSE(matrix.get(3, 4));
    REQUIRE(copy != matrix);
}

TEST_CASE("BitMatrix equality checks shape", "[bitmatrix]") {
    REQUIRE(make_matrix(3, 3) == make_matrix(3, 3));
    REQUIRE(make_matrix(3, 3) != make_matrix(3, 4));
    // Same word count per row, different width
    REQUIRE(make_matrix(3, 3) != make_matrix(4, 3));
}
