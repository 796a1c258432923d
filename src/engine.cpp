#include "mancala/engine.h"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace mancala {

namespace {

void check_slot(int slot) {
    if (slot < 0 || slot >= SLOT_COUNT)
        throw std::out_of_range("slot index out of range: " + std::to_string(slot));
}

void check_player(int player) {
    if (player != 0 && player != 1)
        throw std::out_of_range("player index out of range: " + std::to_string(player));
}

} // namespace

std::string error_message(MoveError error) {
    switch (error) {
        case MoveError::STORE_NOT_SELECTABLE: return "Sorry, you can't select the store.";
        case MoveError::NOT_YOUR_PIT: return "Sorry, you don't control that pit.";
        case MoveError::EMPTY_PIT: return "Sorry, that pit is empty.";
    }
    return "Sorry, that move is not allowed.";
}

// ===================================================================
// ROUND SETUP
// ===================================================================

MancalaEngine::MancalaEngine() : board_state(initial_board()), to_move(0) {}

void MancalaEngine::new_round() {
    board_state = initial_board();
    to_move = 0;
}

void MancalaEngine::set_position(const Board& board, int active_player) {
    check_player(active_player);
    for (int slot = 0; slot < SLOT_COUNT; ++slot) {
        if (board[slot] < 0)
            throw std::invalid_argument("negative seed count in slot " + std::to_string(slot));
    }
    board_state = board;
    to_move = active_player;
}

RoundState MancalaEngine::state() const {
    if (seeds_in_pits(board_state, 0) == 0 || seeds_in_pits(board_state, 1) == 0) return RoundState::OVER;
    return RoundState::IN_PROGRESS;
}

// ===================================================================
// MOVE VALIDATION
// ===================================================================

std::optional<MoveError> MancalaEngine::validate_move(int pit, int player) const {
    check_slot(pit);
    check_player(player);
    if (is_store(pit)) return MoveError::STORE_NOT_SELECTABLE;
    if (!is_own_pit(pit, player)) return MoveError::NOT_YOUR_PIT;
    if (board_state[pit] == 0) return MoveError::EMPTY_PIT;
    return std::nullopt;
}

// ===================================================================
// SOWING
// ===================================================================

int MancalaEngine::distribute_seeds(int pit, int player) {
    check_slot(pit);
    check_player(player);
    int last_index = sow(pit, player);
    rethrow_observer_failure();
    return last_index;
}

int MancalaEngine::sow(int pit, int player) {
    int seeds = board_state[pit];
    board_state[pit] = 0;
    notify(pit);

    const int skipped = store_index(opponent(player));
    int slot = pit;
    while (seeds > 0) {
        slot = (slot + 1) % SLOT_COUNT;
        if (slot == skipped) continue; // the opponent's store is passed over, not filled
        board_state[slot] += 1;
        --seeds;
        notify(slot);
    }
    return slot;
}

// ===================================================================
// CAPTURE
// ===================================================================

std::optional<Capture> MancalaEngine::check_capture(int last_index, int player) {
    check_slot(last_index);
    check_player(player);
    auto capture = capture_opposite(last_index, player);
    rethrow_observer_failure();
    return capture;
}

std::optional<Capture> MancalaEngine::capture_opposite(int last_index, int player) {
    if (!is_own_pit(last_index, player) || last_index == store_index(player)) return std::nullopt;
    if (board_state[last_index] != 1) return std::nullopt;

    const int opposite = opposite_pit(last_index);
    const int store = store_index(player);
    Capture capture{player, last_index, opposite, board_state[opposite] + board_state[last_index]};
    board_state[store] += capture.seeds;
    board_state[opposite] = 0;
    board_state[last_index] = 0;
    notify(store);
    return capture;
}

// ===================================================================
// TURN
// ===================================================================

MoveResult MancalaEngine::play_move(int pit) {
    if (game_over()) throw std::logic_error("the round is over; no further moves are accepted");

    MoveResult result;
    result.player = to_move;
    result.pit = pit;
    if (auto error = validate_move(pit, to_move)) {
        result.error = error;
        return result;
    }

    result.last_index = sow(pit, to_move);
    result.capture = capture_opposite(result.last_index, to_move);
    result.extra_turn = result.last_index == store_index(to_move);
    if (!result.extra_turn) to_move = opponent(to_move);
    rethrow_observer_failure();
    return result;
}

// ===================================================================
// SCORING
// ===================================================================

int MancalaEngine::score(int player) const {
    check_player(player);
    return seeds_in_pits(board_state, player) + board_state[store_index(player)];
}

Winner MancalaEngine::winner() const {
    int score0 = score(0), score1 = score(1);
    if (score0 == score1) return Winner::TIE;
    return score0 > score1 ? Winner::PLAYER_0 : Winner::PLAYER_1;
}

// The first observer failure of a step is held and later calls are skipped until it is rethrown.
void MancalaEngine::notify(int slot) {
    if (!observer || observer_failure) return;
    try {
        observer(board_state, slot);
    } catch (...) {
        observer_failure = std::current_exception();
    }
}

void MancalaEngine::rethrow_observer_failure() {
    if (!observer_failure) return;
    std::exception_ptr failure = std::move(observer_failure);
    observer_failure = nullptr;
    std::rethrow_exception(failure);
}

} // namespace mancala
