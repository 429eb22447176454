#pragma once

#include "tile_link/core/types.hpp"

#include <string>

namespace tile_link::io {

// Screen region spanned by two opposite corners given in any order.
// Throws ValidationError for a zero width or height.
CellRect calibrate_from_corners(const PixelPoint& a, const PixelPoint& b);

// "board:" YAML snippet with board_x/board_y/board_w/board_h
std::string format_roi_yaml(const CellRect& roi);

// Parses "X,Y"; ValidationError on malformed input
PixelPoint parse_point(const std::string& text);

} // namespace tile_link::io
