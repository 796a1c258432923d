#include "mancala/game.h"

#include <cctype>
#include <utility>

namespace mancala {

MancalaGame::MancalaGame(std::string name0, std::string name1, MoveSource& source0, MoveSource& source1,
                         std::ostream& output)
    : names{std::move(name0), std::move(name1)}, sources{&source0, &source1}, out(output) {
    engine.set_board_observer([this](const Board&, int) { show_board(); });
}

BoardSnapshot MancalaGame::snapshot() const {
    return BoardSnapshot{engine.board(), names, engine.active_player(), engine.game_over()};
}

void MancalaGame::show_board() { out << render_frame(snapshot()) << std::flush; }

void MancalaGame::report_move(const MoveResult& result) {
    if (result.capture) {
        out << names[result.player] << " captured the contents of pits " << pit_label(result.capture->opposite_pit)
            << " and " << pit_label(result.capture->pit) << '\n';
    }
    if (result.extra_turn) out << names[result.player] << " gets an extra turn!" << '\n';
}

// ===================================================================
// ROUND LOOP
// ===================================================================

RoundOutcome MancalaGame::play_round() {
    engine.new_round();
    show_board();

    while (!engine.game_over()) {
        int player = engine.active_player();
        TurnResult turn = sources[player]->get_move(engine, player);
        if (turn.is_quit()) return RoundOutcome::QUIT;

        MoveResult result = engine.play_move(turn.pit);
        if (!result.ok()) {
            // Sources are expected to validate; a rejected move is reported and asked for again.
            out << error_message(*result.error) << '\n';
            continue;
        }
        report_move(result);
    }

    show_board();
    out << '\n' << winner_message(names, engine.score(0), engine.score(1)) << '\n';
    return RoundOutcome::FINISHED;
}

bool ask_play_again(std::istream& in, std::ostream& out) {
    out << '\n';
    std::string line;
    while (true) {
        out << "Would you like to play again (y/n)? " << std::flush;
        if (!std::getline(in, line)) return false;
        auto first = line.find_first_not_of(" \t\r\n");
        char response = first == std::string::npos
                            ? '\0'
                            : static_cast<char>(std::tolower(static_cast<unsigned char>(line[first])));
        if (response == 'y') return true;
        if (response == 'n') return false;
        out << "Please type 'y' or 'n'." << '\n';
    }
}

} // namespace mancala
