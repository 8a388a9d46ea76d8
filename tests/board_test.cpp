#include <gtest/gtest.h>

#include "board.h"
#include "color.h"

using namespace Board;

namespace {
    void fillRow(GameBoard &board, int row, int colorIdx) {
        for (int col = 0; col < board.getWidth(); ++col)
            board.setCell(col, row, colorIdx);
    }
}

TEST(GameBoardTest, StartsEmpty) {
    GameBoard board(10, 20);
    EXPECT_EQ(10, board.getWidth());
    EXPECT_EQ(20, board.getHeight());
    for (int row = 0; row < 20; ++row) {
        EXPECT_FALSE(board.isRowFull(row));
        for (int col = 0; col < 10; ++col)
            EXPECT_TRUE(board.isEmpty(col, row));
    }
}

TEST(GameBoardTest, NothingToClear) {
    GameBoard board(10, 20);
    board.setCell(3, 19, Color::RED);
    EXPECT_EQ(0, board.clearFullRows());
    EXPECT_EQ(Color::RED, board.cellAt(3, 19));
}

TEST(GameBoardTest, ClearsSeparatedRowsAndKeepsOrder) {
    GameBoard board(4, 6);
    fillRow(board, 5, Color::CYAN);
    board.setCell(0, 4, Color::RED);
    fillRow(board, 3, Color::BLUE);
    board.setCell(1, 2, Color::GREEN);

    EXPECT_EQ(2, board.clearFullRows());
    ASSERT_EQ(6u, board.getCells().size());

    EXPECT_EQ(Color::RED, board.cellAt(0, 5));
    EXPECT_EQ(Color::GREEN, board.cellAt(1, 4));
    for (int row = 0; row < 4; ++row)
        for (int col = 0; col < 4; ++col)
            EXPECT_TRUE(board.isEmpty(col, row)) << col << "," << row;
}

TEST(GameBoardTest, ClearsWholeBoard) {
    GameBoard board(3, 5);
    for (int row = 0; row < 5; ++row)
        fillRow(board, row, Color::ORANGE);

    EXPECT_EQ(5, board.clearFullRows());
    EXPECT_EQ(5, board.getHeight());
    for (int row = 0; row < 5; ++row)
        for (int col = 0; col < 3; ++col)
            EXPECT_TRUE(board.isEmpty(col, row));
}
