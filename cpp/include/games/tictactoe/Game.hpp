#pragma once

#include "games/tictactoe/MoveResult.hpp"
#include "games/tictactoe/Types.hpp"

#include <array>
#include <optional>

namespace tictactoe {

/*
 * Owns the full state of a single game: the board, the piece to move, and the outcome once there
 * is one.
 *
 * The only mutator is apply_move(). A game starts with an empty board and kX to move, and is
 * finished as soon as winner() is set. After that, every apply_move() call is rejected with
 * kGameAlreadyOver.
 *
 * Not thread-safe. Callers sharing a Game between threads must serialize access themselves.
 */
class Game {
 public:
  Game() = default;

  static Game initialize() { return Game(); }

  /*
   * Places current_piece() at (row, col), hands the turn to the opposite piece, and updates the
   * outcome.
   *
   * Rejections are checked in this order, and leave the state unchanged:
   *
   * 1. kGameAlreadyOver, if is_finished()
   * 2. kInvalidPosition, if (row, col) is off the board
   * 3. kTileOccupied, if the tile is not empty
   */
  MoveResult apply_move(int row, int col);

  bool is_finished() const { return outcome_.has_value(); }
  std::optional<outcome_t> winner() const { return outcome_; }
  piece_t current_piece() const { return current_piece_; }
  const Board& board() const { return board_; }

  // Equals the number of occupied tiles.
  int num_moves() const { return num_moves_; }

 private:
  using Line = std::array<Tile, kBoardDimension>;

  static std::optional<piece_t> get_line_winner(const Line& line);

  Line get_row(int row) const;
  Line get_col(int col) const;
  Line get_main_diag() const;
  Line get_anti_diag() const;
  bool is_board_full() const;

  void update_outcome(int row, int col);
  void set_outcome(outcome_t outcome);

  Board board_ = {};
  piece_t current_piece_ = kX;
  std::optional<outcome_t> outcome_;
  int num_moves_ = 0;
};

}  // namespace tictactoe

#include "inline/games/tictactoe/Game.inl"
