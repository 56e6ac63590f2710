#pragma once

#include <string_view>

namespace flipbook::sprite {

// The five ratios the image generation service accepts, ordered from tallest to widest.
enum class AspectRatio {
    Portrait9x16,
    Portrait3x4,
    Square,
    Landscape4x3,
    Landscape16x9,
};

// Nearest canonical ratio for a columns x rows grid. Both counts must be positive.
AspectRatio classify(int columns, int rows);

// "9:16", "3:4", "1:1", "4:3" or "16:9".
std::string_view label(AspectRatio ratio);

}
