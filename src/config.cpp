#include "config.h"

#include <stdexcept>

#include "color.h"

using namespace std;

namespace Config {

    Settings::Settings()
        : boardWidth(BOARD_W), boardHeight(BOARD_H), cellSize(CELL),
          tickIntervalMs(TICK_INTERVAL_MS), normalDropSpeed(FALL_SPEED),
          fastDropSpeed(FAST_DROP_SPEED), pointsPerRow(POINTS_PER_ROW),
          labelHeight(LABEL_H), shapes(Tetromino::standardShapes()),
          palette({Color::CYAN, Color::YELLOW, Color::PURPLE, Color::GREEN,
                   Color::RED, Color::ORANGE, Color::BLUE}),
          windowTitle(WINDOW_TITLE) {}

    static void requirePositive(int value, const char *field) {
        if (value <= 0)
            throw invalid_argument(string(field) + " must be positive, got " + to_string(value));
    }

    static void validateShape(const Tetromino::Shape &shape, size_t index, int boardWidth) {
        string name = "shapes[" + to_string(index) + "]";
        if (shape.empty() || shape[0].empty())
            throw invalid_argument(name + " is empty");

        size_t cols = shape[0].size();
        bool occupied = false;
        for (const auto &row : shape) {
            if (row.size() != cols)
                throw invalid_argument(name + " is not rectangular");
            for (int cell : row) {
                if (cell != 0 && cell != 1)
                    throw invalid_argument(name + " has a cell other than 0 or 1");
                if (cell == 1)
                    occupied = true;
            }
        }
        if (!occupied)
            throw invalid_argument(name + " has no occupied cell");
        if ((int)cols > boardWidth)
            throw invalid_argument(name + " is wider than the board");
    }

    void validate(const Settings &settings) {
        requirePositive(settings.boardWidth, "boardWidth");
        requirePositive(settings.boardHeight, "boardHeight");
        requirePositive(settings.cellSize, "cellSize");
        requirePositive(settings.tickIntervalMs, "tickIntervalMs");
        requirePositive(settings.normalDropSpeed, "normalDropSpeed");
        requirePositive(settings.fastDropSpeed, "fastDropSpeed");
        if (settings.pointsPerRow < 0)
            throw invalid_argument("pointsPerRow must not be negative");
        if (settings.labelHeight < 0)
            throw invalid_argument("labelHeight must not be negative");

        if (settings.shapes.empty())
            throw invalid_argument("shapes must not be empty");
        for (size_t i = 0; i < settings.shapes.size(); ++i)
            validateShape(settings.shapes[i], i, settings.boardWidth);

        if (settings.palette.empty())
            throw invalid_argument("palette must not be empty");
        for (int colorIdx : settings.palette) {
            if (!Color::isKnownColor(colorIdx))
                throw invalid_argument("palette has unknown color " + to_string(colorIdx));
        }
    }
}
