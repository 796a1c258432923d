#ifndef MANCALA_MOVE_SOURCE_H
#define MANCALA_MOVE_SOURCE_H

#include <deque>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "mancala/engine.h"

namespace mancala {

// ===================================================================
// TURN RESULT
// ===================================================================
struct TurnResult {
    enum class ActionType { MOVE, QUIT };
    ActionType action;
    int pit;

    static TurnResult move(int p) { return TurnResult{ActionType::MOVE, p}; }
    static TurnResult quit() { return TurnResult{ActionType::QUIT, -1}; }

    bool is_quit() const { return action == ActionType::QUIT; }
    bool operator==(const TurnResult& other) const {
        return action == other.action && pit == other.pit;
    }
};

// ===================================================================
// MOVE SOURCES
// ===================================================================
class MoveSource {
public:
    virtual ~MoveSource() {}
    virtual TurnResult get_move(const MancalaEngine& engine, int player) = 0;
};

// Replays a fixed list of pit indexes, then quits.
class ScriptedMoveSource : public MoveSource {
private:
    std::deque<int> pits;

public:
    explicit ScriptedMoveSource(const std::vector<int>& p) : pits(p.begin(), p.end()) {}
    TurnResult get_move(const MancalaEngine& engine, int player) override;
    bool exhausted() const { return pits.empty(); }
};

// Reads pit letters line by line until one names a legal pit for player.
// "q" or end of input quits.
class ConsoleMoveSource : public MoveSource {
private:
    std::string name;
    std::istream& in;
    std::ostream& out;

public:
    ConsoleMoveSource(std::string player_name, std::istream& input, std::ostream& output)
        : name(std::move(player_name)), in(input), out(output) {}
    TurnResult get_move(const MancalaEngine& engine, int player) override;
};

} // namespace mancala

#endif // MANCALA_MOVE_SOURCE_H
