#include "tile_link/solver/solver.hpp"

#include <array>
#include <deque>
#include <vector>

namespace tile_link::solver {

namespace {

constexpr int kNoDirection = -1;
constexpr std::array<std::array<int, 2>, 4> kDirections{{{-1, 0}, {1, 0}, {0, -1}, {0, 1}}};

struct SearchState {
    int row;
    int col;
    int dir;
    int turns;
};

} // namespace

Board pad_board(const Board& board) {
    Board padded = Board::Zero(board.rows() + 2, board.cols() + 2);
    padded.block(1, 1, board.rows(), board.cols()) = board;
    return padded;
}

bool can_connect(const Board& padded, const Cell& a, const Cell& b) {
    if (a == b) {
        return false;
    }

    const int rows = static_cast<int>(padded.rows());
    const int cols = static_cast<int>(padded.cols());
    auto in_bounds = [&](int r, int c) { return r >= 0 && r < rows && c >= 0 && c < cols; };
    if (!in_bounds(a.row, a.col) || !in_bounds(b.row, b.col)) {
        return false;
    }

    const int tile_a = padded(a.row, a.col);
    const int tile_b = padded(b.row, b.col);
    if (tile_a <= 0 || tile_b <= 0 || tile_a != tile_b) {
        return false;
    }

    // Best turn count seen per (row, col, direction); -1 = unvisited
    std::vector<int> best_turns(static_cast<size_t>(rows) * cols * kDirections.size(), -1);
    auto state_index = [&](int r, int c, int d) {
        return (static_cast<size_t>(r) * cols + c) * kDirections.size() + static_cast<size_t>(d);
    };

    std::deque<SearchState> queue;
    queue.push_back({a.row, a.col, kNoDirection, 0});

    while (!queue.empty()) {
        const SearchState s = queue.front();
        queue.pop_front();

        for (int d = 0; d < static_cast<int>(kDirections.size()); ++d) {
            const int next_turns = (s.dir == kNoDirection || s.dir == d) ? s.turns : s.turns + 1;
            if (next_turns > kMaxTurns) {
                continue;
            }

            const int dr = kDirections[d][0];
            const int dc = kDirections[d][1];
            int r = s.row + dr;
            int c = s.col + dc;
            while (in_bounds(r, c)) {
                if (r == b.row && c == b.col) {
                    return true;
                }
                if (padded(r, c) != kEmptyTile) {
                    break;
                }

                int& best = best_turns[state_index(r, c, d)];
                if (best < 0 || next_turns < best) {
                    best = next_turns;
                    queue.push_back({r, c, d, next_turns});
                }
                r += dr;
                c += dc;
            }
        }
    }
    return false;
}

std::optional<Pair> find_pair(const Board& board) {
    const int rows = static_cast<int>(board.rows());
    const int cols = static_cast<int>(board.cols());
    const Board padded = pad_board(board);

    for (int r1 = 0; r1 < rows; ++r1) {
        for (int c1 = 0; c1 < cols; ++c1) {
            const int tile = board(r1, c1);
            if (tile <= 0) {
                continue;
            }
            for (int r2 = r1; r2 < rows; ++r2) {
                for (int c2 = (r2 == r1 ? c1 + 1 : 0); c2 < cols; ++c2) {
                    if (board(r2, c2) != tile) {
                        continue;
                    }
                    if (can_connect(padded, {r1 + 1, c1 + 1}, {r2 + 1, c2 + 1})) {
                        return Pair{{r1, c1}, {r2, c2}};
                    }
                }
            }
        }
    }
    return std::nullopt;
}

int count_tiles(const Board& board) {
    return static_cast<int>((board.array() > 0).count());
}

} // namespace tile_link::solver
