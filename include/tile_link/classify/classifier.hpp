#pragma once

#include "tile_link/config/configuration.hpp"
#include "tile_link/core/types.hpp"
#include "tile_link/io/templates.hpp"

#include <opencv2/core.hpp>

#include <map>
#include <vector>

namespace tile_link::classify {

// First-pass marker for cells that are neither obstacle nor empty
constexpr int kUnresolvedTile = -2;

struct CellVerdict {
    int tile_id = kEmptyTile;
    float score = 0.0f;
    cv::Mat prepared;  // normalized crop, empty for a zero-area cell
};

// Catalog mode: best template wins if it clears match_threshold and leads the
// runner-up by min_margin_to_second_best, otherwise 0 with the best score.
CellVerdict classify_catalog_cell(const cv::Mat& cell_bgr, const io::TemplateCatalog& catalog,
                                  const config::ClassifierConfig& cfg);

// Anchors mode first pass: -1 (block), 0 (empty) or kUnresolvedTile.
CellVerdict classify_anchor_cell(const cv::Mat& cell_bgr, const io::AnchorTemplates& anchors,
                                 const config::ClassifierConfig& cfg);

struct GroupedTiles {
    std::map<Cell, int> ids;
    std::map<Cell, float> confidence;
};

// Groups unresolved cells by pairwise similarity. Even groups of size >= 2
// receive ids 1, 2, ... in order of their smallest cell; odd groups and
// singletons are ambiguous and get id 0 with confidence 0.
GroupedTiles group_tiles_by_similarity(const std::map<Cell, cv::Mat>& prepared_cells,
                                       float threshold, int parallel_workers = 1);

// Classifies every cell of the frame. The alternative held by refs selects
// the mode. Board and confidence always have the configured shape.
Classification classify(const cv::Mat& frame, const io::ReferenceSet& refs,
                        const config::Config& cfg);

// Number of cells classified as empty/unknown with confidence below threshold
int count_uncertain_cells(const Classification& result, float threshold);

} // namespace tile_link::classify
