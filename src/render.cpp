#include "mancala/render.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace mancala {

namespace {

void put_slot(std::ostringstream& os, int seeds) { os << ' ' << std::setw(2) << seeds; }

// Counts UTF-8 code points, so "Zoë" is three columns wide.
std::size_t display_width(const std::string& text) {
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

std::string name_with_marker(const BoardSnapshot& snapshot, int player) {
    if (!snapshot.round_over && snapshot.active_player == player) return snapshot.names[player] + " *";
    return snapshot.names[player];
}

} // namespace

std::string render_frame(const BoardSnapshot& snapshot) {
    const Board& b = snapshot.board;
    const std::string sp(display_width(name_with_marker(snapshot, 1)), ' ');
    std::ostringstream os;

    os << sp << "  ↓  f  e  d  c  b  a  ←  " << name_with_marker(snapshot, 0) << '\n';
    os << sp;
    for (int slot = store_index(0); slot >= first_pit(0); --slot) put_slot(os, b[slot]);
    os << '\n';
    os << sp << " ------------------------" << '\n';
    os << sp << "   ";
    for (int slot = first_pit(1); slot <= store_index(1); ++slot) put_slot(os, b[slot]);
    os << '\n';
    os << name_with_marker(snapshot, 1) << "  →  g  h  i  j  k  l  ↑" << '\n';
    return os.str();
}

std::string winner_message(const std::array<std::string, 2>& names, int score0, int score1) {
    if (score0 == score1) return "Tie game!";
    int winner = score0 > score1 ? 0 : 1;
    std::ostringstream os;
    os << names[winner] << " wins " << std::max(score0, score1) << " to " << std::min(score0, score1) << ".";
    return os.str();
}

} // namespace mancala
