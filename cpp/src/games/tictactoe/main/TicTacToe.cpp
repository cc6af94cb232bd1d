#include "games/tictactoe/Main.hpp"

int main(int ac, char* av[]) { return tictactoe::Main::main(ac, av); }
