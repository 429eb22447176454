#include "tile_link/classify/classifier.hpp"
#include "tile_link/core/disjoint_set.hpp"
#include "tile_link/core/errors.hpp"
#include "tile_link/core/utils.hpp"
#include "tile_link/image/grid.hpp"
#include "tile_link/image/similarity.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <limits>
#include <mutex>
#include <thread>
#include <variant>

namespace tile_link::classify {

namespace {

float clamp_unit(float v) {
    return std::min(1.0f, std::max(0.0f, v));
}

// Runs fn(i) for i in [0, n) on up to `workers` threads. Each index is
// processed exactly once; the first exception thrown is rethrown here.
template <typename Fn>
void parallel_for(std::size_t n, int workers, Fn fn) {
    if (workers <= 1 || n <= 1) {
        for (std::size_t i = 0; i < n; ++i) {
            fn(i);
        }
        return;
    }

    std::atomic<std::size_t> next{0};
    std::exception_ptr first_error;
    std::mutex error_mutex;

    std::vector<std::thread> pool;
    pool.reserve(static_cast<size_t>(workers));
    for (int w = 0; w < workers; ++w) {
        pool.emplace_back([&]() {
            while (true) {
                std::size_t i = next.fetch_add(1);
                if (i >= n) break;
                try {
                    fn(i);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!first_error) first_error = std::current_exception();
                    next.store(n);
                }
            }
        });
    }
    for (auto& t : pool) {
        t.join();
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

struct FirstPass {
    Classification result;
    std::map<Cell, cv::Mat> unresolved;
};

template <typename CellFn>
FirstPass run_first_pass(const cv::Mat& frame, const config::Config& cfg, CellFn classify_cell) {
    const int rows = cfg.board.rows;
    const int cols = cfg.board.cols;
    const std::size_t n = static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols);

    std::vector<CellVerdict> verdicts(n);
    const int workers = core::compute_worker_count(cfg.runtime.parallel_workers, n);
    parallel_for(n, workers, [&](std::size_t i) {
        const Cell cell{static_cast<int>(i) / cols, static_cast<int>(i) % cols};
        verdicts[i] = classify_cell(image::crop_cell(frame, cell, cfg.board));
    });

    FirstPass pass;
    pass.result.board = Board::Zero(rows, cols);
    pass.result.confidence = ConfidenceMap::Zero(rows, cols);
    for (std::size_t i = 0; i < n; ++i) {
        const int r = static_cast<int>(i) / cols;
        const int c = static_cast<int>(i) % cols;
        const CellVerdict& v = verdicts[i];
        if (v.tile_id == kUnresolvedTile) {
            pass.result.confidence(r, c) = clamp_unit(v.score);
            pass.unresolved.emplace(Cell{r, c}, v.prepared);
        } else {
            pass.result.board(r, c) = v.tile_id;
            pass.result.confidence(r, c) = clamp_unit(v.score);
        }
    }
    return pass;
}

} // namespace

CellVerdict classify_catalog_cell(const cv::Mat& cell_bgr, const io::TemplateCatalog& catalog,
                                  const config::ClassifierConfig& cfg) {
    CellVerdict out;
    if (cell_bgr.empty() || catalog.templates.empty()) {
        return out;
    }
    out.prepared = image::prepare_for_match(cell_bgr);

    int best_id = kEmptyTile;
    float best = -std::numeric_limits<float>::infinity();
    float second = -std::numeric_limits<float>::infinity();
    for (const auto& t : catalog.templates) {
        const float score = image::match_similarity(out.prepared, t.prepared);
        if (score > best) {
            second = best;
            best = score;
            best_id = t.id;
        } else if (score > second) {
            second = score;
        }
    }
    // With a single template `second` stays at -inf and the margin always holds.
    const bool accepted = best >= cfg.match_threshold &&
                          (best - second) >= cfg.min_margin_to_second_best;
    out.tile_id = accepted ? best_id : kEmptyTile;
    out.score = best;
    return out;
}

CellVerdict classify_anchor_cell(const cv::Mat& cell_bgr, const io::AnchorTemplates& anchors,
                                 const config::ClassifierConfig& cfg) {
    CellVerdict out;
    if (cell_bgr.empty()) {
        return out;
    }
    out.prepared = image::prepare_for_match(cell_bgr);

    const float block_score = image::match_similarity(out.prepared, anchors.block.prepared);
    if (block_score >= cfg.block_match_threshold) {
        out.tile_id = kBlockTile;
        out.score = block_score;
        return out;
    }

    const float ratio = image::marked_ratio(cell_bgr, cfg);
    const float texture = image::texture_std(cell_bgr);
    if (ratio >= cfg.empty_marked_ratio_threshold && texture <= cfg.empty_texture_threshold) {
        out.tile_id = kEmptyTile;
        out.score = ratio;
        return out;
    }

    out.tile_id = kUnresolvedTile;
    out.score = std::max(block_score, ratio);
    return out;
}

GroupedTiles group_tiles_by_similarity(const std::map<Cell, cv::Mat>& prepared_cells,
                                       float threshold, int parallel_workers) {
    GroupedTiles out;
    if (prepared_cells.empty()) {
        return out;
    }

    // std::map keeps cells in row-major order
    std::vector<Cell> cells;
    std::vector<const cv::Mat*> crops;
    for (const auto& [cell, crop] : prepared_cells) {
        cells.push_back(cell);
        crops.push_back(&crop);
    }
    const std::size_t k = cells.size();

    // Pairwise scores are read-only work; only the union step is serial.
    std::vector<float> scores(k * k, 0.0f);
    const int workers = core::compute_worker_count(parallel_workers, k);
    parallel_for(k, workers, [&](std::size_t i) {
        for (std::size_t j = i + 1; j < k; ++j) {
            const float s = image::match_similarity(*crops[i], *crops[j]);
            scores[i * k + j] = s;
            scores[j * k + i] = s;
        }
    });

    core::DisjointSet sets(k);
    for (std::size_t i = 0; i < k; ++i) {
        for (std::size_t j = i + 1; j < k; ++j) {
            if (scores[i * k + j] >= threshold) {
                sets.unite(i, j);
            }
        }
    }

    int next_id = 1;
    for (const auto& group : sets.groups()) {
        const std::size_t size = group.size();
        if (size < 2 || (size % 2) != 0) {
            for (std::size_t idx : group) {
                out.ids[cells[idx]] = kEmptyTile;
                out.confidence[cells[idx]] = 0.0f;
            }
            continue;
        }

        for (std::size_t idx : group) {
            double sum = 0.0;
            for (std::size_t other : group) {
                if (other != idx) sum += scores[idx * k + other];
            }
            out.ids[cells[idx]] = next_id;
            out.confidence[cells[idx]] = clamp_unit(static_cast<float>(sum / static_cast<double>(size - 1)));
        }
        ++next_id;
    }
    return out;
}

Classification classify(const cv::Mat& frame, const io::ReferenceSet& refs,
                        const config::Config& cfg) {
    if (cfg.board.rows <= 0 || cfg.board.cols <= 0) {
        throw ConfigError("board.rows and board.cols must be > 0");
    }
    const cv::Mat bgr = image::to_bgr(frame);

    if (const auto* catalog = std::get_if<io::TemplateCatalog>(&refs)) {
        if (catalog->templates.empty()) {
            throw ConfigError("no reference images available for catalog classification");
        }
        FirstPass pass = run_first_pass(bgr, cfg, [&](const cv::Mat& cell) {
            return classify_catalog_cell(cell, *catalog, cfg.classifier);
        });
        return pass.result;
    }

    const auto& anchors = std::get<io::AnchorTemplates>(refs);
    if (anchors.block.prepared.empty()) {
        throw ConfigError("no obstacle reference image available for anchor classification");
    }
    FirstPass pass = run_first_pass(bgr, cfg, [&](const cv::Mat& cell) {
        return classify_anchor_cell(cell, anchors, cfg.classifier);
    });

    GroupedTiles grouped = group_tiles_by_similarity(
        pass.unresolved, cfg.classifier.tile_similarity_threshold, cfg.runtime.parallel_workers);
    for (const auto& [cell, id] : grouped.ids) {
        pass.result.board(cell.row, cell.col) = id;
        auto it = grouped.confidence.find(cell);
        pass.result.confidence(cell.row, cell.col) = it != grouped.confidence.end() ? it->second : 0.0f;
    }
    return pass.result;
}

int count_uncertain_cells(const Classification& result, float threshold) {
    int count = 0;
    for (Eigen::Index r = 0; r < result.board.rows(); ++r) {
        for (Eigen::Index c = 0; c < result.board.cols(); ++c) {
            if (result.board(r, c) == kEmptyTile && result.confidence(r, c) < threshold) {
                ++count;
            }
        }
    }
    return count;
}

} // namespace tile_link::classify
