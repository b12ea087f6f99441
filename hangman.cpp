#include <iostream>
#include "game.hpp"

int main(int argc, char* argv[]) {
    return Game::run_program(argc, argv, std::cin, std::cout, std::cerr);
}
