#include "games/tictactoe/MoveResult.hpp"

#include "util/Asserts.hpp"

#include <fmt/format.h>
#include <magic_enum/magic_enum.hpp>
#include <magic_enum/magic_enum_format.hpp>

namespace tictactoe {

inline MoveResult MoveResult::invalid_position(int row, int col) {
  MoveResult result(kInvalidPosition);
  result.row_ = row;
  result.col_ = col;
  return result;
}

inline MoveResult MoveResult::tile_occupied(piece_t piece, int row, int col) {
  MoveResult result(kTileOccupied);
  result.piece_ = piece;
  result.row_ = row;
  result.col_ = col;
  return result;
}

inline int MoveResult::row() const {
  RELEASE_ASSERT(type_ == kInvalidPosition || type_ == kTileOccupied,
                 "MoveResult of type {} has no row", type_);
  return row_;
}

inline int MoveResult::col() const {
  RELEASE_ASSERT(type_ == kInvalidPosition || type_ == kTileOccupied,
                 "MoveResult of type {} has no col", type_);
  return col_;
}

inline piece_t MoveResult::piece() const {
  RELEASE_ASSERT(type_ == kTileOccupied, "MoveResult of type {} has no piece", type_);
  return piece_;
}

inline std::string MoveResult::to_str() const {
  switch (type_) {
    case kInvalidPosition:
      return fmt::format("{}(row={}, col={})", type_, row_, col_);
    case kTileOccupied:
      return fmt::format("{}(piece={}, row={}, col={})", type_, piece_, row_, col_);
    default:
      return std::string(magic_enum::enum_name(type_));
  }
}

}  // namespace tictactoe
