#include "mancala/move_source.h"

#include <algorithm>
#include <cctype>

namespace mancala {

namespace {

std::string normalize(const std::string& line) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto first = std::find_if(line.begin(), line.end(), not_space);
    auto last = std::find_if(line.rbegin(), line.rend(), not_space).base();
    std::string result = first < last ? std::string(first, last) : std::string();
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

TurnResult ScriptedMoveSource::get_move(const MancalaEngine&, int) {
    if (pits.empty()) return TurnResult::quit();
    int pit = pits.front();
    pits.pop_front();
    return TurnResult::move(pit);
}

TurnResult ConsoleMoveSource::get_move(const MancalaEngine& engine, int player) {
    std::string line;
    while (true) {
        out << '\n' << name << ", select one of your pits that is not empty (or enter q to quit): " << std::flush;
        if (!std::getline(in, line)) return TurnResult::quit();

        std::string selection = normalize(line);
        if (selection == "q") return TurnResult::quit();
        if (selection.size() != 1 || !std::isalpha(static_cast<unsigned char>(selection[0]))) {
            out << "Please enter a single letter." << '\n';
            continue;
        }
        auto pit = parse_pit_label(selection[0]);
        if (!pit) {
            out << "Please enter a letter corresponding to one of your non-empty pits." << '\n';
            continue;
        }
        if (auto error = engine.validate_move(*pit, player)) {
            out << error_message(*error) << '\n';
            continue;
        }
        return TurnResult::move(*pit);
    }
}

} // namespace mancala
