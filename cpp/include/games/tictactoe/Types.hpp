#pragma once

#include <fmt/format.h>
#include <magic_enum/magic_enum.hpp>
#include <magic_enum/magic_enum_format.hpp>

#include <array>
#include <cstdint>
#include <optional>

namespace tictactoe {

const int kBoardDimension = 3;
const int kNumCells = kBoardDimension * kBoardDimension;

// kX always moves first.
enum piece_t : uint8_t { kX = 0, kO = 1 };

enum outcome_t : uint8_t { kXWins = 0, kOWins = 1, kTie = 2 };

constexpr piece_t opposite(piece_t piece) { return piece == kX ? kO : kX; }

constexpr outcome_t win_for(piece_t piece) { return piece == kX ? kXWins : kOWins; }

// An empty tile is represented by std::nullopt.
using Tile = std::optional<piece_t>;

/*
 * Indexed as board[row][col]:
 *
 * [0][0] [0][1] [0][2]
 * [1][0] [1][1] [1][2]
 * [2][0] [2][1] [2][2]
 */
using Board = std::array<std::array<Tile, kBoardDimension>, kBoardDimension>;

inline bool in_bounds(int row, int col) {
  return row >= 0 && row < kBoardDimension && col >= 0 && col < kBoardDimension;
}

}  // namespace tictactoe
