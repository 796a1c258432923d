#include <exception>
#include <iostream>

#include "mancala/game.h"
#include "mancala/move_source.h"

int main(int argc, char** argv) {
    if (argc != 3) {
        std::cerr << "usage: " << (argc > 0 ? argv[0] : "mancala") << " <name0> <name1>" << std::endl;
        return 2;
    }

    try {
        mancala::ConsoleMoveSource source0(argv[1], std::cin, std::cout);
        mancala::ConsoleMoveSource source1(argv[2], std::cin, std::cout);
        mancala::MancalaGame game(argv[1], argv[2], source0, source1, std::cout);

        while (game.play_round() == mancala::RoundOutcome::FINISHED) {
            if (!mancala::ask_play_again(std::cin, std::cout)) break;
        }
        std::cout << "Thanks for playing!" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "mancala: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
