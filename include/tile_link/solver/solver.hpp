#pragma once

#include "tile_link/core/types.hpp"

#include <optional>

namespace tile_link::solver {

// Maximum number of 90 degree direction changes on a connecting path
constexpr int kMaxTurns = 2;

// Board surrounded by a one-cell border of empty tiles
Board pad_board(const Board& board);

// Whether padded cells a and b hold the same positive id and are joined by an
// orthogonal path through empty cells with at most kMaxTurns turns.
// Coordinates are on the padded board.
bool can_connect(const Board& padded, const Cell& a, const Cell& b);

// First connectable pair in row-major order (unpadded coordinates), or
// nullopt when the board has no legal move.
std::optional<Pair> find_pair(const Board& board);

// Number of cells holding a positive tile id
int count_tiles(const Board& board);

} // namespace tile_link::solver
