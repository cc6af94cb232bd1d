#include "games/tictactoe/Game.hpp"

#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"

namespace tictactoe {

MoveResult Game::apply_move(int row, int col) {
  if (is_finished()) {
    return MoveResult::game_already_over();
  }
  if (!in_bounds(row, col)) {
    return MoveResult::invalid_position(row, col);
  }
  const Tile& tile = board_[row][col];
  if (tile.has_value()) {
    return MoveResult::tile_occupied(*tile, row, col);
  }

  board_[row][col] = current_piece_;
  current_piece_ = opposite(current_piece_);
  ++num_moves_;

  update_outcome(row, col);

  LOG_DEBUG("tictactoe::Game: move {} at ({}, {}), finished={}", num_moves_, row, col,
            is_finished());
  return MoveResult::success();
}

/*
 * Only the lines passing through the just-played tile at (row, col) are examined. This is correct
 * only because a line that did not contain the new piece had the same contents before the move,
 * and so would already have ended the game. Anything that rewrites the board other than by a
 * single placement (e.g. undo, or loading a position) must rescan all lines instead.
 */
void Game::update_outcome(int row, int col) {
  RELEASE_ASSERT(!is_finished(), "outcome evaluated after the game was over");

  // A line of empty tiles never yields a winner; used for diagonals that miss the pivot.
  const Line no_line = {};

  Line candidates[] = {
    get_row(row),
    get_col(col),
    row == col ? get_main_diag() : no_line,
    row + col == kBoardDimension - 1 ? get_anti_diag() : no_line,
  };

  for (const Line& line : candidates) {
    std::optional<piece_t> winner = get_line_winner(line);
    if (winner.has_value()) {
      set_outcome(win_for(*winner));
      return;
    }
  }

  if (is_board_full()) {
    set_outcome(kTie);
  }
}

void Game::set_outcome(outcome_t outcome) {
  RELEASE_ASSERT(!outcome_.has_value(), "outcome already set, cannot set to {}", outcome);
  outcome_ = outcome;
}

}  // namespace tictactoe
