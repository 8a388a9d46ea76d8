#ifndef TETRIS_TETROMINO_H
#define TETRIS_TETROMINO_H

#include <vector>

// ============================================================================
// TETROMINO MODULE
// ============================================================================

namespace Tetromino {
    // Rows of 0/1 cells; every row has the same length.
    using Shape = std::vector<std::vector<int>>;

    // Order of standardShapes().
    enum ShapeType { SHAPE_I, SHAPE_O, SHAPE_T, SHAPE_S, SHAPE_Z, SHAPE_L, SHAPE_J };

    const std::vector<Shape>& standardShapes();

    // 90 degrees clockwise: the transpose of the rows taken bottom to top.
    Shape rotateCW(const Shape &shape);

    class Piece {
    public:
        Shape shape;
        int colorIndex;
        int x;
        int y;
        int pixelY;  // top edge in canvas pixels, advanced by gravity

        Piece();
        // Spawns at row 0, centered on a board boardWidth cells wide.
        Piece(const Shape &shape, int colorIndex, int boardWidth);

        int width() const;
        int height() const;
        bool occupies(int col, int row) const { return shape[row][col] == 1; }
        int subCellOffset(int cellSize) const { return pixelY - y * cellSize; }

        void rotate();
    };
}

#endif
