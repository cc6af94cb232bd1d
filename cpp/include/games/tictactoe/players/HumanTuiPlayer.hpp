#pragma once

#include "games/tictactoe/Game.hpp"
#include "games/tictactoe/IO.hpp"

#include <iostream>
#include <optional>

namespace tictactoe {

/*
 * Drives a game between two humans sharing one terminal: shows the board, reads a move for the
 * piece to play, and repeats until the game is finished or the input runs out.
 *
 * Board, prompts and results go to out; complaints about rejected input go to err.
 */
class HumanTuiPlayer {
 public:
  struct Params {
    // Log every applied move at info level.
    bool debug_engine = false;

    auto make_options_description();
  };

  HumanTuiPlayer(const Params& params, std::istream& in = std::cin, std::ostream& out = std::cout,
                 std::ostream& err = std::cerr);

  /*
   * Returns true if the game was played to completion, false if the input ran out first. Either
   * way, this is a normal way for the session to end.
   */
  bool play(Game& game);

 private:
  // Prompts until a well-formed move is read. Returns std::nullopt on end-of-input.
  std::optional<Move> prompt_for_move();

  void print_state(const Game& game);
  void end_game(const Game& game);

  const Params params_;
  std::istream& in_;
  std::ostream& out_;
  std::ostream& err_;
};

}  // namespace tictactoe

#include "inline/games/tictactoe/players/HumanTuiPlayer.inl"
