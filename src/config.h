#ifndef TETRIS_CONFIG_H
#define TETRIS_CONFIG_H

#include <string>
#include <vector>

#include "tetromino.h"

// ============================================================================
// CONFIG MODULE
// ============================================================================

namespace Config {
    const int BOARD_W = 10;
    const int BOARD_H = 20;
    const int CELL = 30;
    const int TICK_INTERVAL_MS = 10;
    const int FALL_SPEED = 1;          // pixels per tick
    const int FAST_DROP_SPEED = 100;   // pixels per tick while Down is held
    const int POINTS_PER_ROW = 100;
    const int LABEL_H = 24;            // score strip under the board
    const char *const WINDOW_TITLE = "Tetris";

    struct Settings {
        int boardWidth;
        int boardHeight;
        int cellSize;
        int tickIntervalMs;
        int normalDropSpeed;
        int fastDropSpeed;
        int pointsPerRow;
        int labelHeight;
        std::vector<Tetromino::Shape> shapes;
        std::vector<int> palette;
        std::string windowTitle;

        Settings();

        int canvasWidth() const { return boardWidth * cellSize; }
        int canvasHeight() const { return boardHeight * cellSize; }
        int windowHeight() const { return canvasHeight() + labelHeight; }
    };

    // Throws std::invalid_argument naming the first bad field.
    void validate(const Settings &settings);
}

#endif
