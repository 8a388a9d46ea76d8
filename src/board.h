#ifndef TETRIS_BOARD_H
#define TETRIS_BOARD_H

#include <vector>

// ============================================================================
// BOARD MODULE
// ============================================================================

namespace Board {

    // Grid of locked cells, row 0 at the top. Each cell holds a Color index,
    // Color::EMPTY when free.
    class GameBoard {
    private:
        int width;
        int height;
        std::vector<std::vector<int>> cells;

    public:
        GameBoard(int w, int h);

        bool isRowFull(int row) const;

        // Drops every full row and refills from the top with empty rows.
        // Returns the number of rows removed.
        int clearFullRows();

        int getWidth() const { return width; }
        int getHeight() const { return height; }
        int cellAt(int col, int row) const { return cells[row][col]; }
        bool isEmpty(int col, int row) const;
        void setCell(int col, int row, int colorIdx) { cells[row][col] = colorIdx; }
        const std::vector<std::vector<int>>& getCells() const { return cells; }
    };
}

#endif
