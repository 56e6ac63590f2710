#include "sprite/aspect_ratio.hpp"

namespace flipbook::sprite {
namespace {

constexpr double kRatio9x16  = 9.0 / 16.0;
constexpr double kRatio3x4   = 3.0 / 4.0;
constexpr double kRatio1x1   = 1.0;
constexpr double kRatio4x3   = 4.0 / 3.0;
constexpr double kRatio16x9  = 16.0 / 9.0;

constexpr double midpoint(double a, double b) { return (a + b) / 2.0; }

}

AspectRatio classify(int columns, int rows) {
    const double ratio = static_cast<double>(columns) / static_cast<double>(rows);

    if (ratio > midpoint(kRatio16x9, kRatio4x3)) {
        return AspectRatio::Landscape16x9;
    }
    if (ratio > midpoint(kRatio4x3, kRatio1x1)) {
        return AspectRatio::Landscape4x3;
    }
    if (ratio > midpoint(kRatio1x1, kRatio3x4)) {
        return AspectRatio::Square;
    }
    if (ratio > midpoint(kRatio3x4, kRatio9x16)) {
        return AspectRatio::Portrait3x4;
    }
    return AspectRatio::Portrait9x16;
}

std::string_view label(AspectRatio ratio) {
    switch (ratio) {
        case AspectRatio::Portrait9x16:  return "9:16";
        case AspectRatio::Portrait3x4:   return "3:4";
        case AspectRatio::Square:        return "1:1";
        case AspectRatio::Landscape4x3:  return "4:3";
        case AspectRatio::Landscape16x9: return "16:9";
    }
    return "1:1";
}

}
