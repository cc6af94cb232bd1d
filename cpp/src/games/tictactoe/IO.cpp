#include "games/tictactoe/IO.hpp"

#include "util/Exceptions.hpp"

#include <fmt/format.h>

namespace tictactoe {

std::string IO::outcome_to_str(outcome_t outcome) {
  switch (outcome) {
    case kXWins:
      return "x wins!";
    case kOWins:
      return "o wins!";
    case kTie:
      return "Tie!";
    default:
      throw util::Exception("Unknown outcome: {}", outcome);
  }
}

std::string IO::move_to_str(int row, int col) {
  return fmt::format("{}{}", row + 1, char('A' + col));
}

std::optional<Move> IO::parse_move(const std::string& input, std::string* offending_token) {
  auto reject = [&](const std::string& token) -> std::optional<Move> {
    if (offending_token) *offending_token = token;
    return std::nullopt;
  };

  if (input.size() != 2) return reject(input);

  char r = input[0];
  if (r < '1' || r >= '1' + kBoardDimension) return reject(input);

  char c = input[1];
  if (c >= 'a' && c < 'a' + kBoardDimension) {
    c = c - 'a' + 'A';
  }
  if (c < 'A' || c >= 'A' + kBoardDimension) return reject(std::string(1, input[1]));

  return Move{r - '1', c - 'A'};
}

void IO::print_board(std::ostream& os, const Board& board) {
  os << "  ";
  for (int col = 0; col < kBoardDimension; ++col) {
    os << ' ' << char('A' + col);
  }
  os << '\n';

  for (int row = 0; row < kBoardDimension; ++row) {
    os << ' ' << row + 1;
    for (const Tile& tile : board[row]) {
      os << ' ' << (tile.has_value() ? piece_to_str(*tile) : kEmptyTileGlyph);
    }
    os << '\n';
  }

  os << std::endl;
}

std::string IO::rejection_to_str(const MoveResult& result) {
  switch (result.type()) {
    case MoveResult::kGameAlreadyOver:
      return "The game is already over!";
    case MoveResult::kInvalidPosition:
      return fmt::format("Position ({}, {}) is not on the board!", result.row(), result.col());
    case MoveResult::kTileOccupied:
      return fmt::format("The tile at position {} already has piece {} in it!",
                         move_to_str(result.row(), result.col()), piece_to_str(result.piece()));
    default:
      throw util::Exception("Not a rejection: {}", result.to_str());
  }
}

}  // namespace tictactoe
