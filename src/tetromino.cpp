#include "tetromino.h"

using namespace std;

namespace Tetromino {

    const vector<Shape>& standardShapes() {
        static const vector<Shape> shapes = {
            {{1, 1, 1, 1}},             // I
            {{1, 1}, {1, 1}},           // O
            {{0, 1, 0}, {1, 1, 1}},     // T
            {{1, 1, 0}, {0, 1, 1}},     // S
            {{0, 1, 1}, {1, 1, 0}},     // Z
            {{1, 1, 1}, {1, 0, 0}},     // L
            {{1, 1, 1}, {0, 0, 1}}      // J
        };
        return shapes;
    }

    Shape rotateCW(const Shape &shape) {
        if (shape.empty())
            return Shape();

        int rows = shape.size();
        int cols = shape[0].size();
        Shape rotated(cols, vector<int>(rows, 0));
        for (int r = 0; r < rows; ++r)
            for (int c = 0; c < cols; ++c)
                rotated[c][rows - 1 - r] = shape[r][c];
        return rotated;
    }

    Piece::Piece() : colorIndex(0), x(0), y(0), pixelY(0) {}

    Piece::Piece(const Shape &s, int color, int boardWidth)
        : shape(s), colorIndex(color), x(0), y(0), pixelY(0) {
        x = boardWidth / 2 - width() / 2;
    }

    int Piece::width() const {
        return shape.empty() ? 0 : shape[0].size();
    }

    int Piece::height() const {
        return shape.size();
    }

    void Piece::rotate() {
        shape = rotateCW(shape);
    }
}
