#include "sprite/frame_geometry.hpp"

#include <algorithm>
#include <cmath>

namespace flipbook::sprite {

FrameGeometry resolve(const SheetDimensions& sheet, const GridShape& grid, int frame_count) {
    if (grid.columns <= 0) {
        throw InvalidGeometry("grid columns must be positive, got " + std::to_string(grid.columns));
    }
    if (frame_count <= 0) {
        throw InvalidGeometry("frame count must be positive, got " + std::to_string(frame_count));
    }
    if (sheet.width <= 0 || sheet.height <= 0) {
        throw InvalidGeometry("sheet dimensions must be positive, got " +
                              std::to_string(sheet.width) + "x" + std::to_string(sheet.height));
    }

    FrameGeometry geometry;
    geometry.effective_rows = (frame_count + grid.columns - 1) / grid.columns;
    geometry.frame_width = static_cast<double>(sheet.width) / static_cast<double>(grid.columns);
    geometry.frame_height = static_cast<double>(sheet.height) / static_cast<double>(geometry.effective_rows);
    return geometry;
}

FrameOffset frame_offset(int frame_index, int columns, const FrameGeometry& geometry) {
    if (columns <= 0) {
        return FrameOffset{};
    }
    const int column = frame_index % columns;
    const int row = frame_index / columns;
    FrameOffset offset;
    // Written as 0 - value so column 0 yields +0.0 rather than -0.0.
    offset.x = 0.0 - static_cast<double>(column) * geometry.frame_width;
    offset.y = 0.0 - static_cast<double>(row) * geometry.frame_height;
    return offset;
}

FrameRect frame_source_rect(int frame_index, int columns, const FrameGeometry& geometry) {
    const FrameOffset offset = frame_offset(frame_index, columns, geometry);
    return FrameRect{ -offset.x, -offset.y, geometry.frame_width, geometry.frame_height };
}

PixelRect to_pixel_rect(const FrameRect& rect) {
    const double left = std::floor(rect.x);
    const double top = std::floor(rect.y);
    PixelRect px;
    px.x = static_cast<int>(left);
    px.y = static_cast<int>(top);
    px.w = static_cast<int>(std::floor(rect.x + rect.w) - left);
    px.h = static_cast<int>(std::floor(rect.y + rect.h) - top);
    return px;
}

double preview_scale(const FrameGeometry& geometry, double max_preview_size) {
    if (!geometry.resolved()) {
        return 1.0;
    }
    const double fit = std::min(max_preview_size / geometry.frame_width,
                                max_preview_size / geometry.frame_height);
    return std::max(1.0, fit);
}

}
