#include "board.h"

#include "color.h"

using namespace std;

namespace Board {

    GameBoard::GameBoard(int w, int h)
        : width(w), height(h), cells(h, vector<int>(w, Color::EMPTY)) {}

    bool GameBoard::isEmpty(int col, int row) const {
        return cells[row][col] == Color::EMPTY;
    }

    bool GameBoard::isRowFull(int row) const {
        for (int cell : cells[row]) {
            if (cell == Color::EMPTY)
                return false;
        }
        return true;
    }

    int GameBoard::clearFullRows() {
        vector<vector<int>> kept;
        for (int row = 0; row < height; ++row) {
            if (!isRowFull(row))
                kept.push_back(cells[row]);
        }

        int cleared = height - kept.size();
        if (cleared == 0)
            return 0;

        vector<vector<int>> newCells(cleared, vector<int>(width, Color::EMPTY));
        newCells.insert(newCells.end(), kept.begin(), kept.end());
        cells = newCells;
        return cleared;
    }
}
