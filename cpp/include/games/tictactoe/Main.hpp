#pragma once

#include <iostream>

namespace tictactoe {

/*
 * Entry point of the tictactoe executable: parses the command line, sets up logging, and plays
 * one game between two humans on the terminal.
 *
 * Returns 0 when the game ends, or when the input runs out first. Returns 1 if the command line or
 * logging setup is rejected, or if the game loop fails.
 */
struct Main {
  static int main(int ac, char* av[], std::istream& in = std::cin, std::ostream& out = std::cout,
                  std::ostream& err = std::cerr);
};

}  // namespace tictactoe

#include "inline/games/tictactoe/Main.inl"
