// Google Test for PuzzleState (creation, validation, goal and solvability)
#include <gtest/gtest.h>
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <unordered_set>
#include <vector>

#include "puzzle_errors.hpp"
#include "state.hpp"

TEST(StateTest, ValidCreationAndBlankPosition) {
    std::vector<int> tiles = {1, 2, 3, 4, 5, 6, 7, 8, 0};
    PuzzleState s(tiles);

    EXPECT_EQ(s.get_tiles(), tiles);
    EXPECT_EQ(s.get_side_length(), 3);
    EXPECT_EQ(s.get_blank_position(), 8);
    EXPECT_EQ(s.get_blank_row(), 2);
    EXPECT_EQ(s.get_blank_column(), 2);
}

TEST(StateTest, FifteenPuzzleCreation) {
    PuzzleState s = PuzzleState::from_string("1 2 3 4 5 6 7 8 9 10 11 12 13 14 0 15");
    EXPECT_EQ(s.get_side_length(), 4);
    EXPECT_EQ(s.get_num_cells(), 16);
    EXPECT_EQ(s.get_blank_position(), 14);
    EXPECT_EQ(s.get_tile(15), 15);
}

TEST(StateTest, FromString) {
    PuzzleState s = PuzzleState::from_string("4 5 0 6 1 8 7 3 2");
    EXPECT_EQ(s.get_tiles(), (std::vector<int>{4, 5, 0, 6, 1, 8, 7, 3, 2}));
    EXPECT_EQ(s.get_blank_position(), 2);

    // Surrounding and repeated whitespace is accepted
    PuzzleState t = PuzzleState::from_string("  1 2 3\t4 5 6  7 8 0 \n");
    EXPECT_TRUE(t.is_goal());
}

TEST(StateTest, FromStringRejectsGarbage) {
    EXPECT_THROW(PuzzleState::from_string("1 2 3 4 x 6 7 8 0"), InvalidStateError);
    EXPECT_THROW(PuzzleState::from_string("1 2 3 4 5.5 6 7 8 0"), InvalidStateError);
    EXPECT_THROW(PuzzleState::from_string(""), InvalidStateError);
}

TEST(StateTest, WrongLengthThrows) {
    EXPECT_THROW(PuzzleState(std::vector<int>{1, 2, 3, 0}), InvalidStateError);
    EXPECT_THROW(PuzzleState(std::vector<int>{1, 2, 3, 4, 5, 6, 7, 0}), InvalidStateError);
    std::vector<int> twenty_five(25);
    std::iota(twenty_five.begin(), twenty_five.end(), 0);
    EXPECT_THROW(PuzzleState{twenty_five}, InvalidStateError);
}

TEST(StateTest, DuplicateTilesThrows) {
    // 0 is missing, 3 appears twice
    EXPECT_THROW(PuzzleState(std::vector<int>{1, 2, 3, 3, 5, 6, 7, 8, 4}), InvalidStateError);
    // two blanks
    EXPECT_THROW(PuzzleState(std::vector<int>{1, 2, 3, 4, 0, 6, 7, 8, 0}), InvalidStateError);
}

TEST(StateTest, OutOfRangeTileValueThrows) {
    EXPECT_THROW(PuzzleState(std::vector<int>{1, 2, 3, 4, 9, 6, 7, 8, 0}), InvalidStateError);
    EXPECT_THROW(PuzzleState(std::vector<int>{1, 2, 3, 4, -5, 6, 7, 8, 0}), InvalidStateError);
}

TEST(StateTest, InvalidStateIsAnInvalidArgument) {
    EXPECT_THROW(PuzzleState(std::vector<int>{0, 0, 0, 0, 0, 0, 0, 0, 0}), std::invalid_argument);
}

TEST(StateTest, GoalState) {
    EXPECT_TRUE(PuzzleState::goal(3).is_goal());
    EXPECT_EQ(PuzzleState::goal(3).to_string(), "1 2 3 4 5 6 7 8 0");
    EXPECT_TRUE(PuzzleState::goal(4).is_goal());
    EXPECT_EQ(PuzzleState::goal(4).to_string(), "1 2 3 4 5 6 7 8 9 10 11 12 13 14 15 0");
    EXPECT_THROW(PuzzleState::goal(5), InvalidStateError);

    EXPECT_FALSE(PuzzleState::from_string("1 2 3 4 0 6 7 8 5").is_goal());
    EXPECT_FALSE(PuzzleState::from_string("0 1 2 3 4 5 6 7 8").is_goal());
}

TEST(StateTest, SolvabilityEightPuzzle) {
    EXPECT_TRUE(PuzzleState::from_string("1 2 3 4 5 6 7 8 0").is_solvable());
    EXPECT_TRUE(PuzzleState::from_string("1 2 3 4 5 6 7 0 8").is_solvable());
    EXPECT_TRUE(PuzzleState::from_string("8 1 2 7 0 3 6 5 4").is_solvable());   // 14 inversions

    EXPECT_FALSE(PuzzleState::from_string("1 2 3 4 0 6 7 8 5").is_solvable());  // 3 inversions
    EXPECT_FALSE(PuzzleState::from_string("1 2 3 4 5 6 8 7 0").is_solvable());  // 1 inversion
    EXPECT_FALSE(PuzzleState::from_string("8 1 2 0 4 3 7 6 5").is_solvable());  // 11 inversions
    EXPECT_FALSE(PuzzleState::from_string("4 5 0 6 1 8 7 3 2").is_solvable());  // 15 inversions
}

TEST(StateTest, InversionCount) {
    EXPECT_EQ(PuzzleState::goal(3).count_inversions(), 0);
    EXPECT_EQ(PuzzleState::from_string("8 1 2 7 0 3 6 5 4").count_inversions(), 14);
    EXPECT_EQ(PuzzleState::from_string("4 5 0 6 1 8 7 3 2").count_inversions(), 15);
    EXPECT_EQ(PuzzleState::from_string("8 1 2 0 4 3 7 6 5").count_inversions(), 11);
}

TEST(StateTest, SolvabilityFifteenPuzzle) {
    // Blank on the last row: the inversion count alone decides
    EXPECT_TRUE(PuzzleState::from_string("1 2 3 4 5 6 7 8 9 10 11 12 13 14 0 15").is_solvable());
    EXPECT_FALSE(PuzzleState::from_string("1 2 3 4 5 6 7 8 9 10 11 12 13 15 14 0").is_solvable());
    // Blank one row up, zero inversions: odd row distance makes it unsolvable
    EXPECT_FALSE(PuzzleState::from_string("1 2 3 4 5 6 7 8 9 10 11 0 12 13 14 15").is_solvable());
    // Blank moved up from the goal: one vertical move, solvable
    EXPECT_TRUE(PuzzleState::from_string("1 2 3 4 5 6 7 8 9 10 11 0 13 14 15 12").is_solvable());
    EXPECT_TRUE(PuzzleState::from_string("5 3 4 7 1 6 8 0 2 10 11 12 9 13 14 15").is_solvable());
}

TEST(StateTest, SolvabilityPartitionsEightPuzzleSpace) {
    std::vector<int> tiles(9);
    std::iota(tiles.begin(), tiles.end(), 0);
    long solvable = 0;
    long unsolvable = 0;
    do {
        if (PuzzleState(tiles).is_solvable()) {
            ++solvable;
        } else {
            ++unsolvable;
        }
    } while (std::next_permutation(tiles.begin(), tiles.end()));
    EXPECT_EQ(solvable, 181440);
    EXPECT_EQ(unsolvable, 181440);
}

TEST(StateTest, EqualityAndHash) {
    PuzzleState a = PuzzleState::from_string("1 2 3 4 5 6 7 0 8");
    PuzzleState b = PuzzleState::from_string("1 2 3 4 5 6 7 0 8");
    PuzzleState c = PuzzleState::from_string("1 2 3 4 5 6 0 7 8");
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(a.hash(), b.hash());
    EXPECT_TRUE(a < c || c < a);

    std::unordered_set<PuzzleState> visited;
    visited.insert(a);
    visited.insert(b);
    visited.insert(c);
    EXPECT_EQ(visited.size(), 2u);
    EXPECT_EQ(visited.count(PuzzleState::from_string("1 2 3 4 5 6 7 0 8")), 1u);
}

TEST(StateTest, Rendering) {
    PuzzleState s = PuzzleState::from_string("4 5 0 6 1 8 7 3 2");
    EXPECT_EQ(s.to_string(), "4 5 0 6 1 8 7 3 2");
    EXPECT_EQ(s.to_grid_string(), "4 5 b\n6 1 8\n7 3 2");
}

TEST(StateTest, MoveNames) {
    EXPECT_STREQ(move_name(Move::Up), "up");
    EXPECT_STREQ(move_name(Move::Right), "right");
    EXPECT_EQ(parse_move("down"), Move::Down);
    EXPECT_EQ(parse_move("left"), Move::Left);
    EXPECT_THROW(parse_move("sideways"), std::invalid_argument);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
