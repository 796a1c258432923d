#include <gtest/gtest.h>

#include <stdexcept>

#include "mancala/board.h"

namespace mancala {
namespace {

TEST(BoardTest, InitialBoardHasFourSeedsPerPitAndEmptyStores) {
    Board expected = {4, 4, 4, 4, 4, 4, 0, 4, 4, 4, 4, 4, 4, 0};
    EXPECT_EQ(initial_board(), expected);
    EXPECT_EQ(total_seeds(initial_board()), TOTAL_SEEDS);
    EXPECT_EQ(seeds_in_pits(initial_board(), 0), 24);
    EXPECT_EQ(seeds_in_pits(initial_board(), 1), 24);
}

TEST(BoardTest, OwnershipIsPositionalAndIncludesTheStore) {
    for (int slot = 0; slot <= 6; ++slot) {
        EXPECT_TRUE(is_own_pit(slot, 0)) << slot;
        EXPECT_FALSE(is_own_pit(slot, 1)) << slot;
    }
    for (int slot = 7; slot <= 13; ++slot) {
        EXPECT_TRUE(is_own_pit(slot, 1)) << slot;
        EXPECT_FALSE(is_own_pit(slot, 0)) << slot;
    }
}

TEST(BoardTest, StoresAndOppositePits) {
    EXPECT_EQ(store_index(0), 6);
    EXPECT_EQ(store_index(1), 13);
    EXPECT_TRUE(is_store(6));
    EXPECT_TRUE(is_store(13));
    EXPECT_FALSE(is_store(0));
    EXPECT_FALSE(is_store(12));
    EXPECT_EQ(opposite_pit(2), 10);
    EXPECT_EQ(opposite_pit(0), 12);
    EXPECT_EQ(opposite_pit(5), 7);
    EXPECT_EQ(opposite_pit(opposite_pit(9)), 9);
    EXPECT_EQ(opponent(0), 1);
    EXPECT_EQ(opponent(1), 0);
}

TEST(BoardTest, PitLabels) {
    EXPECT_EQ(pit_label(0), 'a');
    EXPECT_EQ(pit_label(5), 'f');
    EXPECT_EQ(pit_label(7), 'g');
    EXPECT_EQ(pit_label(12), 'l');
    EXPECT_THROW(pit_label(6), std::out_of_range);
    EXPECT_THROW(pit_label(13), std::out_of_range);
    EXPECT_THROW(pit_label(14), std::out_of_range);
}

TEST(BoardTest, ParsePitLabel) {
    EXPECT_EQ(parse_pit_label('a'), 0);
    EXPECT_EQ(parse_pit_label('F'), 5);
    EXPECT_EQ(parse_pit_label('g'), 7);
    EXPECT_EQ(parse_pit_label('L'), 12);
    EXPECT_FALSE(parse_pit_label('m').has_value());
    EXPECT_FALSE(parse_pit_label('.').has_value());
    EXPECT_FALSE(parse_pit_label('1').has_value());
    EXPECT_FALSE(parse_pit_label('\0').has_value());
}

} // namespace
} // namespace mancala
