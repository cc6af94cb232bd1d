#pragma once

#include "games/tictactoe/Types.hpp"

#include <cstdint>
#include <string>

namespace tictactoe {

/*
 * A MoveResult is what Game::apply_move() returns: either success, or the reason the move was
 * rejected, together with the data that describes the rejection:
 *
 * - kGameAlreadyOver: the game had already reached an outcome. No payload.
 *
 * - kInvalidPosition: row() and/or col() is outside [0, kBoardDimension).
 *
 * - kTileOccupied: the tile at (row(), col()) already holds piece().
 *
 * None of the rejections are fatal. The game state is left untouched whenever ok() is false.
 */
class MoveResult {
 public:
  enum result_type_t : uint8_t { kSuccess, kGameAlreadyOver, kInvalidPosition, kTileOccupied };

  static MoveResult success() { return MoveResult(kSuccess); }
  static MoveResult game_already_over() { return MoveResult(kGameAlreadyOver); }
  static MoveResult invalid_position(int row, int col);
  static MoveResult tile_occupied(piece_t piece, int row, int col);

  result_type_t type() const { return type_; }
  bool ok() const { return type_ == kSuccess; }

  // Valid for kInvalidPosition and kTileOccupied
  int row() const;
  int col() const;

  // Valid only for kTileOccupied
  piece_t piece() const;

  std::string to_str() const;

  bool operator==(const MoveResult&) const = default;

 private:
  explicit MoveResult(result_type_t type) : type_(type) {}

  int row_ = -1;
  int col_ = -1;
  piece_t piece_ = kX;
  result_type_t type_;
};

}  // namespace tictactoe

#include "inline/games/tictactoe/MoveResult.inl"
