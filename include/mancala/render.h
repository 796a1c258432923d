#ifndef MANCALA_RENDER_H
#define MANCALA_RENDER_H

#include <array>
#include <string>

#include "mancala/board.h"

namespace mancala {

struct BoardSnapshot {
    Board board;
    std::array<std::string, 2> names;
    int active_player = 0;
    bool round_over = false;
};

// Player 0's row runs right to left out of its store, player 1's left to right into its store.
// The active player's name is marked with " *" while the round is in progress. The rows above
// player 1's name are indented by its marked width, counted in UTF-8 code points, so the pit
// letters stay under their counts.
//
//      ↓  f  e  d  c  b  a  ←  Ann
//      0  4  4  4  4  4  4
//     ------------------------
//         4  4  4  4  4  4  0
// Bob  →  g  h  i  j  k  l  ↑
std::string render_frame(const BoardSnapshot& snapshot);

std::string winner_message(const std::array<std::string, 2>& names, int score0, int score1);

} // namespace mancala

#endif // MANCALA_RENDER_H
