#include "tile_link/io/calibration.hpp"
#include "tile_link/core/errors.hpp"
#include "tile_link/core/utils.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>

namespace tile_link::io {

CellRect calibrate_from_corners(const PixelPoint& a, const PixelPoint& b) {
    CellRect roi;
    roi.x = std::min(a.x, b.x);
    roi.y = std::min(a.y, b.y);
    roi.width = std::abs(a.x - b.x);
    roi.height = std::abs(a.y - b.y);
    if (roi.width == 0 || roi.height == 0) {
        throw ValidationError("calibration corners span an empty region");
    }
    return roi;
}

std::string format_roi_yaml(const CellRect& roi) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "board" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "board_x" << YAML::Value << roi.x;
    out << YAML::Key << "board_y" << YAML::Value << roi.y;
    out << YAML::Key << "board_w" << YAML::Value << roi.width;
    out << YAML::Key << "board_h" << YAML::Value << roi.height;
    out << YAML::EndMap;
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

PixelPoint parse_point(const std::string& text) {
    const auto parts = core::split(text, ',');
    if (parts.size() != 2) {
        throw ValidationError("expected X,Y but got '" + text + "'");
    }
    try {
        size_t used_x = 0;
        size_t used_y = 0;
        const std::string xs = core::trim(parts[0]);
        const std::string ys = core::trim(parts[1]);
        PixelPoint p{std::stoi(xs, &used_x), std::stoi(ys, &used_y)};
        if (used_x != xs.size() || used_y != ys.size()) {
            throw ValidationError("expected X,Y but got '" + text + "'");
        }
        return p;
    } catch (const std::logic_error&) {
        throw ValidationError("expected X,Y but got '" + text + "'");
    }
}

} // namespace tile_link::io
