#ifndef MANCALA_ENGINE_H
#define MANCALA_ENGINE_H

#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "mancala/board.h"

namespace mancala {

// ===================================================================
// RESULT TYPES
// ===================================================================

enum class MoveError { STORE_NOT_SELECTABLE, NOT_YOUR_PIT, EMPTY_PIT };

enum class RoundState { IN_PROGRESS, OVER };

enum class Winner { PLAYER_0, PLAYER_1, TIE };

struct Capture {
    int player;
    int pit;          // where the last seed landed
    int opposite_pit;
    int seeds;        // total moved into the store, the landing seed included
};

struct MoveResult {
    std::optional<MoveError> error; // set when rejected; the board was not touched
    int player = -1;
    int pit = -1;
    int last_index = -1;
    std::optional<Capture> capture;
    bool extra_turn = false;

    bool ok() const { return !error.has_value(); }
};

std::string error_message(MoveError error);

// Called after the pick-up, after each placed seed and after a capture (with the store slot).
// An exception thrown by the observer does not interrupt the move: the engine finishes the
// rule step (and, under play_move, the turn update) and then rethrows it.
using BoardObserver = std::function<void(const Board& board, int slot)>;

// ===================================================================
// RULES ENGINE
// ===================================================================

class MancalaEngine {
private:
    Board board_state;
    int to_move;
    BoardObserver observer;
    std::exception_ptr observer_failure;

    int sow(int pit, int player);
    std::optional<Capture> capture_opposite(int last_index, int player);
    void notify(int slot);
    void rethrow_observer_failure();

public:
    MancalaEngine();

    // Canonical board, player 0 to move.
    void new_round();
    // Loads an arbitrary position. Throws std::invalid_argument on negative counts.
    void set_position(const Board& board, int active_player);

    const Board& board() const { return board_state; }
    int active_player() const { return to_move; }
    RoundState state() const;
    bool game_over() const { return state() == RoundState::OVER; }

    // --- Rule steps ---
    std::optional<MoveError> validate_move(int pit, int player) const;
    int distribute_seeds(int pit, int player);
    std::optional<Capture> check_capture(int last_index, int player);

    // Validate, sow, capture and advance the turn pointer for the active player.
    // Throws std::logic_error once the round is over.
    MoveResult play_move(int pit);

    // --- Scoring ---
    int score(int player) const;
    Winner winner() const;

    void set_board_observer(BoardObserver fn) { observer = std::move(fn); }
};

} // namespace mancala

#endif // MANCALA_ENGINE_H
