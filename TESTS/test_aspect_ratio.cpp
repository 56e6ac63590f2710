#include "doctest/doctest.h"

#include <string>

#include "sprite/aspect_ratio.hpp"

using flipbook::sprite::AspectRatio;
using flipbook::sprite::classify;
using flipbook::sprite::label;

TEST_CASE("aspect ratio classification of the canonical grids") {
    CHECK(classify(1, 1) == AspectRatio::Square);
    CHECK(classify(16, 9) == AspectRatio::Landscape16x9);
    CHECK(classify(9, 16) == AspectRatio::Portrait9x16);
    CHECK(classify(4, 3) == AspectRatio::Landscape4x3);
    CHECK(classify(3, 4) == AspectRatio::Portrait3x4);
}

TEST_CASE("aspect ratio classification of common grids") {
    CHECK(classify(4, 4) == AspectRatio::Square);
    CHECK(classify(16, 16) == AspectRatio::Square);
    CHECK(classify(8, 4) == AspectRatio::Landscape16x9);
    CHECK(classify(16, 1) == AspectRatio::Landscape16x9);
    CHECK(classify(4, 3) == AspectRatio::Landscape4x3);
    CHECK(classify(5, 4) == AspectRatio::Landscape4x3);
    CHECK(classify(3, 4) == AspectRatio::Portrait3x4);
    CHECK(classify(1, 16) == AspectRatio::Portrait9x16);
    CHECK(classify(9, 16) == AspectRatio::Portrait9x16);
}

TEST_CASE("aspect ratio classification either side of each midpoint") {
    // 1:1 / 4:3 midpoint is 7/6.
    CHECK(classify(8, 7) == AspectRatio::Square);
    CHECK(classify(6, 5) == AspectRatio::Landscape4x3);
    // 3:4 / 1:1 midpoint is 7/8.
    CHECK(classify(8, 9) == AspectRatio::Square);
    CHECK(classify(6, 7) == AspectRatio::Portrait3x4);
    // 4:3 / 16:9 midpoint is 14/9.
    CHECK(classify(3, 2) == AspectRatio::Landscape4x3);
    CHECK(classify(8, 5) == AspectRatio::Landscape16x9);
    // 9:16 / 3:4 midpoint is 21/32.
    CHECK(classify(2, 3) == AspectRatio::Portrait3x4);
    CHECK(classify(5, 8) == AspectRatio::Portrait9x16);
}

TEST_CASE("aspect ratio classification only depends on the ratio") {
    for (int cols = 1; cols <= 16; ++cols) {
        for (int rows = 1; rows <= 16; ++rows) {
            CAPTURE(cols);
            CAPTURE(rows);
            CHECK(classify(cols, rows) == classify(cols * 3, rows * 3));
        }
    }
}

TEST_CASE("aspect ratio grids on a midpoint follow double precision arithmetic") {
    // The midpoints are not exactly representable, so these land on one side.
    CHECK(classify(14, 9) == AspectRatio::Landscape16x9);
    CHECK(classify(7, 6) == AspectRatio::Landscape4x3);
    CHECK(classify(7, 8) == AspectRatio::Portrait3x4);
    CHECK(classify(14, 16) == AspectRatio::Portrait3x4);
}

TEST_CASE("aspect ratio labels are the service strings") {
    CHECK(label(AspectRatio::Portrait9x16) == "9:16");
    CHECK(label(AspectRatio::Portrait3x4) == "3:4");
    CHECK(label(AspectRatio::Square) == "1:1");
    CHECK(label(AspectRatio::Landscape4x3) == "4:3");
    CHECK(label(AspectRatio::Landscape16x9) == "16:9");
}
