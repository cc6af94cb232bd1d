#include "games/tictactoe/Game.hpp"

#include <algorithm>

namespace tictactoe {

inline std::optional<piece_t> Game::get_line_winner(const Line& line) {
  if (!line[0].has_value()) return std::nullopt;
  for (const Tile& tile : line) {
    if (tile != line[0]) return std::nullopt;
  }
  return line[0];
}

inline Game::Line Game::get_row(int row) const { return board_[row]; }

inline Game::Line Game::get_col(int col) const {
  Line line;
  for (int row = 0; row < kBoardDimension; ++row) {
    line[row] = board_[row][col];
  }
  return line;
}

inline Game::Line Game::get_main_diag() const {
  Line line;
  for (int i = 0; i < kBoardDimension; ++i) {
    line[i] = board_[i][i];
  }
  return line;
}

inline Game::Line Game::get_anti_diag() const {
  Line line;
  for (int i = 0; i < kBoardDimension; ++i) {
    line[i] = board_[i][kBoardDimension - 1 - i];
  }
  return line;
}

inline bool Game::is_board_full() const {
  return std::all_of(board_.begin(), board_.end(), [](const auto& row) {
    return std::all_of(row.begin(), row.end(), [](const Tile& tile) { return tile.has_value(); });
  });
}

}  // namespace tictactoe
