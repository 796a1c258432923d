#ifndef MANCALA_BOARD_H
#define MANCALA_BOARD_H

#include <array>
#include <optional>

namespace mancala {

// ===================================================================
// BOARD LAYOUT
// ===================================================================
// Slots 0-5 are player 0's pits, 6 is player 0's store,
// 7-12 are player 1's pits, 13 is player 1's store.

constexpr int PITS_PER_SIDE = 6;
constexpr int SLOTS_PER_SIDE = PITS_PER_SIDE + 1;
constexpr int SLOT_COUNT = 2 * SLOTS_PER_SIDE;
constexpr int INITIAL_SEEDS = 4;
constexpr int TOTAL_SEEDS = 2 * PITS_PER_SIDE * INITIAL_SEEDS;
constexpr std::array<int, 2> STORES = {6, 13};

// Maps pit letters to slot indexes; '.' holds the place of player 0's store.
constexpr char PIT_LABELS[] = "abcdef.ghijkl";

using Board = std::array<int, SLOT_COUNT>;

inline constexpr int opponent(int player) { return 1 - player; }
inline constexpr int first_pit(int player) { return player * SLOTS_PER_SIDE; }
inline constexpr int store_index(int player) { return first_pit(player) + PITS_PER_SIDE; }
inline constexpr bool is_store(int slot) { return slot == STORES[0] || slot == STORES[1]; }
inline constexpr int opposite_pit(int pit) { return 12 - pit; }

// True when slot lies on player's side of the board, store included.
inline constexpr bool is_own_pit(int slot, int player) {
    return first_pit(player) <= slot && slot <= store_index(player);
}

Board initial_board();

int seeds_in_pits(const Board& board, int player); // six pits only
int total_seeds(const Board& board);

// --- Pit labels ---
// Stores have no label; asking for one throws std::out_of_range.
char pit_label(int pit);
std::optional<int> parse_pit_label(char label);

} // namespace mancala

#endif // MANCALA_BOARD_H
