#include <gtest/gtest.h>

#include <sstream>
#include <vector>

#include "mancala/game.h"

namespace mancala {
namespace {

TEST(GameTest, QuitEndsTheRoundWithoutFinishingIt) {
    ScriptedMoveSource ann(std::vector<int>{});
    ScriptedMoveSource bob(std::vector<int>{});
    std::ostringstream out;
    MancalaGame game("Ann", "Bob", ann, bob, out);

    EXPECT_EQ(game.play_round(), RoundOutcome::QUIT);
    EXPECT_FALSE(game.current_engine().game_over());
    EXPECT_NE(out.str().find("Bob  →  g  h  i  j  k  l  ↑"), std::string::npos);
    EXPECT_EQ(out.str().find("wins"), std::string::npos);
}

TEST(GameTest, ExtraTurnKeepsAskingTheSamePlayer) {
    ScriptedMoveSource ann(std::vector<int>{2});
    ScriptedMoveSource bob(std::vector<int>{7});
    std::ostringstream out;
    MancalaGame game("Ann", "Bob", ann, bob, out);

    EXPECT_EQ(game.play_round(), RoundOutcome::QUIT);
    EXPECT_NE(out.str().find("Ann gets an extra turn!"), std::string::npos);
    EXPECT_FALSE(bob.exhausted());
    EXPECT_EQ(game.current_engine().active_player(), 0);
}

TEST(GameTest, RejectedMoveIsReportedAndAskedAgain) {
    ScriptedMoveSource ann(std::vector<int>{7, 0});
    ScriptedMoveSource bob(std::vector<int>{});
    std::ostringstream out;
    MancalaGame game("Ann", "Bob", ann, bob, out);

    EXPECT_EQ(game.play_round(), RoundOutcome::QUIT);
    EXPECT_NE(out.str().find("Sorry, you don't control that pit."), std::string::npos);
    EXPECT_TRUE(ann.exhausted());
    Board expected = {0, 5, 5, 5, 5, 4, 0, 4, 4, 4, 4, 4, 4, 0};
    EXPECT_EQ(game.current_engine().board(), expected);
    EXPECT_EQ(game.current_engine().active_player(), 1);
}

TEST(GameTest, ScriptedRoundPlaysToTheEnd) {
    ScriptedMoveSource ann(std::vector<int>{0, 1, 2, 3, 4, 5});
    ScriptedMoveSource bob(std::vector<int>{7, 7, 7, 7});
    std::ostringstream out;
    MancalaGame game("Ann", "Bob", ann, bob, out);

    EXPECT_EQ(game.play_round(), RoundOutcome::FINISHED);
    EXPECT_TRUE(ann.exhausted());
    EXPECT_TRUE(bob.exhausted());

    const MancalaEngine& engine = game.current_engine();
    Board expected = {0, 0, 0, 0, 0, 0, 12, 1, 12, 8, 8, 7, 0, 0};
    EXPECT_EQ(engine.board(), expected);
    EXPECT_EQ(engine.winner(), Winner::PLAYER_1);

    const std::string text = out.str();
    EXPECT_NE(text.find("Ann gets an extra turn!"), std::string::npos);
    EXPECT_NE(text.find("Ann captured the contents of pits l and a"), std::string::npos);
    EXPECT_NE(text.find("Bob wins 36 to 12."), std::string::npos);
}

TEST(GameTest, EveryMutationIsRendered) {
    ScriptedMoveSource ann(std::vector<int>{0});
    ScriptedMoveSource bob(std::vector<int>{});
    std::ostringstream out;
    MancalaGame game("Ann", "Bob", ann, bob, out);
    game.play_round();

    // Opening frame, the pick-up and four placed seeds; Bob then quits.
    const std::string footer = "Bob  →  g  h  i  j  k  l  ↑";
    const std::string text = out.str();
    int frames = 0;
    for (auto pos = text.find(footer); pos != std::string::npos; pos = text.find(footer, pos + 1)) ++frames;
    EXPECT_EQ(frames, 6);
}

TEST(GameTest, NewRoundResetsTheBoard) {
    ScriptedMoveSource ann(std::vector<int>{0});
    ScriptedMoveSource bob(std::vector<int>{});
    std::ostringstream out;
    MancalaGame game("Ann", "Bob", ann, bob, out);
    game.play_round();
    game.play_round();
    EXPECT_EQ(game.current_engine().board(), initial_board());
}

TEST(PlayAgainTest, AcceptsYesAndNoByFirstLetter) {
    std::ostringstream out;
    std::istringstream yes("Yes please\n");
    EXPECT_TRUE(ask_play_again(yes, out));
    std::istringstream no(" n\n");
    EXPECT_FALSE(ask_play_again(no, out));
}

TEST(PlayAgainTest, RepromptsOnAnythingElseAndStopsAtEndOfInput) {
    std::ostringstream out;
    std::istringstream in("maybe\n\ny\n");
    EXPECT_TRUE(ask_play_again(in, out));
    EXPECT_NE(out.str().find("Please type 'y' or 'n'."), std::string::npos);

    std::istringstream closed("");
    EXPECT_FALSE(ask_play_again(closed, out));
}

} // namespace
} // namespace mancala
