#include "games/tictactoe/players/HumanTuiPlayer.hpp"

#include "util/BoostUtil.hpp"
#include "util/Exceptions.hpp"
#include "util/LoggingUtil.hpp"
#include "util/StringUtil.hpp"

#include <string>

namespace tictactoe {

inline auto HumanTuiPlayer::Params::make_options_description() {
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Player options");

  return desc.template add_flag<"debug-engine", "no-debug-engine">(
    &debug_engine, "log every move and the engine's response", "do not log moves");
}

inline HumanTuiPlayer::HumanTuiPlayer(const Params& params, std::istream& in, std::ostream& out,
                                      std::ostream& err)
    : params_(params), in_(in), out_(out), err_(err) {}

inline bool HumanTuiPlayer::play(Game& game) {
  while (!game.is_finished()) {
    print_state(game);

    std::optional<Move> move = prompt_for_move();
    if (!move.has_value()) {
      out_ << std::endl;
      return false;
    }

    piece_t piece = game.current_piece();
    MoveResult result = game.apply_move(move->row, move->col);
    if (params_.debug_engine) {
      LOG_INFO("{} {} -> {}", IO::piece_to_str(piece), IO::move_to_str(move->row, move->col),
               result.to_str());
    }

    switch (result.type()) {
      case MoveResult::kSuccess:
        break;
      case MoveResult::kInvalidPosition:
      case MoveResult::kTileOccupied:
        LOG_DEBUG("Rejected move: {}", result.to_str());
        err_ << IO::rejection_to_str(result) << std::endl;
        break;
      case MoveResult::kGameAlreadyOver:
        // we never prompt once the game is finished
        throw util::Exception("Move rejected with {} mid-game", result.to_str());
      default:
        throw util::Exception("Unexpected move result: {}", result.to_str());
    }
  }

  end_game(game);
  return true;
}

inline std::optional<Move> HumanTuiPlayer::prompt_for_move() {
  while (true) {
    out_ << "Enter move (e.g. 1A): ";
    out_.flush();

    std::string input;
    if (!std::getline(in_, input)) {
      return std::nullopt;
    }
    input = util::rstrip(input);

    std::string offending_token;
    std::optional<Move> move = IO::parse_move(input, &offending_token);
    if (move.has_value()) {
      return move;
    }
    err_ << "Invalid move: '" << offending_token << "'. Please try again." << std::endl;
  }
}

inline void HumanTuiPlayer::print_state(const Game& game) {
  IO::print_board(out_, game.board());
  out_ << "Current piece: " << IO::piece_to_str(game.current_piece()) << std::endl;
}

inline void HumanTuiPlayer::end_game(const Game& game) {
  IO::print_board(out_, game.board());

  std::optional<outcome_t> outcome = game.winner();
  if (!outcome.has_value()) {
    throw util::Exception("end_game() called on an unfinished game");
  }
  out_ << IO::outcome_to_str(*outcome) << std::endl;
}

}  // namespace tictactoe
