#pragma once

#include <Eigen/Dense>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tile_link {

// Matrix types
using Board = Eigen::Matrix<int, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using ConfidenceMap = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Reserved tile ids
constexpr int kBlockTile = -1;     // obstacle, never matchable
constexpr int kEmptyTile = 0;      // empty / background / unknown

// Board cell (row, col)
struct Cell {
    int row = 0;
    int col = 0;

    bool operator==(const Cell& o) const { return row == o.row && col == o.col; }
    bool operator!=(const Cell& o) const { return !(*this == o); }
    bool operator<(const Cell& o) const {
        return row < o.row || (row == o.row && col < o.col);
    }
};

using Pair = std::pair<Cell, Cell>;

// Pixel rectangle (frame or screen space)
struct CellRect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool empty() const { return width <= 0 || height <= 0; }
};

struct PixelPoint {
    int x = 0;
    int y = 0;
};

// Classifier output
struct Classification {
    Board board;
    ConfidenceMap confidence;
};

// Classification mode
enum class ClassifierMode {
    ANCHORS,  // obstacle + empty references, clustering for the rest
    CATALOG   // one reference per tile id
};

inline std::string classifier_mode_to_string(ClassifierMode mode) {
    switch (mode) {
        case ClassifierMode::ANCHORS: return "anchors";
        case ClassifierMode::CATALOG: return "catalog";
        default: return "unknown";
    }
}

inline std::optional<ClassifierMode> string_to_classifier_mode(const std::string& s) {
    if (s == "anchors") return ClassifierMode::ANCHORS;
    if (s == "catalog") return ClassifierMode::CATALOG;
    return std::nullopt;
}

// Labels used for overlay/debug rendering of the reserved ids
inline std::map<int, std::string> core_tile_labels() {
    return {{kBlockTile, "block"}, {kEmptyTile, "background"}};
}

} // namespace tile_link
