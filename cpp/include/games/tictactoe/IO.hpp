#pragma once

#include "games/tictactoe/MoveResult.hpp"
#include "games/tictactoe/Types.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace tictactoe {

struct Move {
  int row;
  int col;

  bool operator==(const Move&) const = default;
};

/*
 * Text conventions of the console front end.
 *
 * Moves are written as <row digit><column letter>, with rows numbered from 1 and columns lettered
 * from A. So "1A" is the top-left tile, (0, 0), and "3C" is the bottom-right tile, (2, 2). The
 * column letter is case-insensitive.
 */
struct IO {
  static constexpr const char* kEmptyTileGlyph = "▢";

  static std::string piece_to_str(piece_t piece) { return piece == kX ? "x" : "o"; }
  static std::string outcome_to_str(outcome_t outcome);
  static std::string move_to_str(int row, int col);

  /*
   * Returns std::nullopt if input is not a valid move. In that case, if offending_token is
   * non-null, it is set to the part of the input to echo back to the user: the whole input, unless
   * only the column letter is bad, in which case just that letter.
   */
  static std::optional<Move> parse_move(const std::string& input,
                                        std::string* offending_token = nullptr);

  /*
   * Example:
   *
   *    A B C
   *  1 x ▢ ▢
   *  2 ▢ o ▢
   *  3 ▢ ▢ ▢
   *
   * Followed by a blank line.
   */
  static void print_board(std::ostream&, const Board&);

  // Message for the user when their move was rejected. Requires !result.ok().
  static std::string rejection_to_str(const MoveResult& result);
};

}  // namespace tictactoe
