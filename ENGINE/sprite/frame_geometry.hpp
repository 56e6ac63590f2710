#pragma once

#include <stdexcept>
#include <string>

namespace flipbook::sprite {

struct SheetDimensions {
    int width = 0;
    int height = 0;
};

struct GridShape {
    int columns = 1;
    int rows = 1;

    int frame_count() const { return columns * rows; }
};

struct FrameGeometry {
    double frame_width = 0.0;
    double frame_height = 0.0;
    int effective_rows = 0;

    bool resolved() const { return frame_width > 0.0 && frame_height > 0.0; }
};

inline bool operator==(const FrameGeometry& a, const FrameGeometry& b) {
    return a.frame_width == b.frame_width && a.frame_height == b.frame_height &&
           a.effective_rows == b.effective_rows;
}

inline bool operator!=(const FrameGeometry& a, const FrameGeometry& b) { return !(a == b); }

// Background translation that reveals one frame; both components are <= 0.
struct FrameOffset {
    double x = 0.0;
    double y = 0.0;
};

struct FrameRect {
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double h = 0.0;
};

struct PixelRect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
};

class InvalidGeometry : public std::invalid_argument {
public:
    explicit InvalidGeometry(const std::string& what) : std::invalid_argument(what) {}
};

// Rows are derived as ceil(frame_count / columns); grid.rows is not consulted because the
// generation service does not reliably produce the row count it was asked for.
// Throws InvalidGeometry for non-positive columns, frame count or sheet size.
FrameGeometry resolve(const SheetDimensions& sheet, const GridShape& grid, int frame_count);

FrameOffset frame_offset(int frame_index, int columns, const FrameGeometry& geometry);

FrameRect frame_source_rect(int frame_index, int columns, const FrameGeometry& geometry);

// Covers [floor(x), floor(x + w)) on each axis, so neighbouring frames share an edge and
// their widths add up to the sheet size.
PixelRect to_pixel_rect(const FrameRect& rect);

// Zoom factor that fits one frame into max_preview_size, never shrinking below 1:1.
// Returns 1 while unresolved.
double preview_scale(const FrameGeometry& geometry, double max_preview_size);

}
