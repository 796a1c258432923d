#include "mancala/board.h"

#include <cctype>
#include <cstring>
#include <numeric>
#include <stdexcept>
#include <string>

namespace mancala {

Board initial_board() {
    Board board{};
    for (int player = 0; player < 2; ++player) {
        for (int i = 0; i < PITS_PER_SIDE; ++i) board[first_pit(player) + i] = INITIAL_SEEDS;
        board[store_index(player)] = 0;
    }
    return board;
}

int seeds_in_pits(const Board& board, int player) {
    auto begin = board.begin() + first_pit(player);
    return std::accumulate(begin, begin + PITS_PER_SIDE, 0);
}

int total_seeds(const Board& board) {
    return std::accumulate(board.begin(), board.end(), 0);
}

char pit_label(int pit) {
    if (pit < 0 || pit >= SLOT_COUNT || is_store(pit))
        throw std::out_of_range("no label for slot " + std::to_string(pit));
    return PIT_LABELS[pit];
}

std::optional<int> parse_pit_label(char label) {
    char lc = static_cast<char>(std::tolower(static_cast<unsigned char>(label)));
    if (!std::isalpha(static_cast<unsigned char>(lc))) return std::nullopt;
    const char* found = std::strchr(PIT_LABELS, lc);
    if (found == nullptr) return std::nullopt;
    return static_cast<int>(found - PIT_LABELS);
}

} // namespace mancala
