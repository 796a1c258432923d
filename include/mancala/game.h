#ifndef MANCALA_GAME_H
#define MANCALA_GAME_H

#include <array>
#include <iostream>
#include <string>

#include "mancala/engine.h"
#include "mancala/move_source.h"
#include "mancala/render.h"

namespace mancala {

enum class RoundOutcome { FINISHED, QUIT };

// ===================================================================
// TURN DRIVER
// ===================================================================
// Owns the engine for a match; the move sources and the output stream are borrowed.
class MancalaGame {
private:
    std::array<std::string, 2> names;
    std::array<MoveSource*, 2> sources;
    std::ostream& out;
    MancalaEngine engine;

    void show_board();
    void report_move(const MoveResult& result);

public:
    MancalaGame(std::string name0, std::string name1, MoveSource& source0, MoveSource& source1,
                std::ostream& output);
    MancalaGame(const MancalaGame&) = delete;
    MancalaGame& operator=(const MancalaGame&) = delete;

    RoundOutcome play_round();

    const MancalaEngine& current_engine() const { return engine; }
    const std::array<std::string, 2>& player_names() const { return names; }
    BoardSnapshot snapshot() const;
};

// Asks until the answer starts with 'y' or 'n'. End of input counts as 'n'.
bool ask_play_again(std::istream& in, std::ostream& out);

} // namespace mancala

#endif // MANCALA_GAME_H
