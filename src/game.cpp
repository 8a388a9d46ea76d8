#include "game.h"

#include <cstdlib>
#include <iostream>
#include <string>

#include "color.h"

using namespace std;

namespace GameEngine {
    using namespace Tetromino;

    static const Config::Settings& validated(const Config::Settings &settings) {
        Config::validate(settings);
        return settings;
    }

    Game::Game(const Config::Settings &s, Display::Surface &surf)
        : settings(validated(s)), surface(surf),
          board(settings.boardWidth, settings.boardHeight),
          score(0), linesClearedTotal(0), running(true), downHeld(false),
          dropSpeed(settings.normalDropSpeed) {
        spawnPiece();
        updateScoreLabel();
    }

    void Game::start() {
        update();
    }

    void Game::spawnPiece() {
        const Shape &shape = settings.shapes[rand() % settings.shapes.size()];
        int colorIdx = settings.palette[rand() % settings.palette.size()];
        currentPiece = Piece(shape, colorIdx, settings.boardWidth);
    }

    bool Game::validMove(int dx, int dy) const {
        for (int r = 0; r < currentPiece.height(); ++r) {
            for (int c = 0; c < currentPiece.width(); ++c) {
                if (!currentPiece.occupies(c, r))
                    continue;

                int newX = currentPiece.x + c + dx;
                int newY = currentPiece.y + r + dy;
                if (newX < 0 || newX >= board.getWidth() || newY >= board.getHeight())
                    return false;
                if (newY >= 0 && !board.isEmpty(newX, newY))
                    return false;
            }
        }
        return true;
    }

    void Game::lockPiece() {
        for (int r = 0; r < currentPiece.height(); ++r) {
            for (int c = 0; c < currentPiece.width(); ++c) {
                int row = currentPiece.y + r;
                // Cells still above the top edge have nowhere to go.
                if (currentPiece.occupies(c, r) && row >= 0 && row < board.getHeight())
                    board.setCell(currentPiece.x + c, row, currentPiece.colorIndex);
            }
        }
        clearFullRows();
        spawnPiece();

        if (!validMove(0, 1) && currentPiece.y == 0)
            gameOver();
    }

    int Game::clearFullRows() {
        int cleared = board.clearFullRows();
        score += cleared * settings.pointsPerRow;
        linesClearedTotal += cleared;
        updateScoreLabel();
        return cleared;
    }

    void Game::gameOver() {
        running = false;
        cout << "Game Over (score " << score << ")" << endl;
    }

    void Game::updateScoreLabel() {
        surface.setLabel("Score: " + to_string(score));
    }

    void Game::update() {
        if (!running)
            return;

        currentPiece.pixelY += dropSpeed;

        int boundary = (currentPiece.y + 1) * settings.cellSize;
        if (currentPiece.pixelY >= boundary) {
            // A sideways move since the last row step can leave the row
            // below occupied; lock in place rather than step into it.
            if (!validMove(0, 1)) {
                lockPiece();
            } else {
                currentPiece.pixelY = boundary;
                currentPiece.y += 1;
                if (!validMove(0, 1))
                    lockPiece();
            }
        }

        surface.requestRedraw();

        dropSpeed = downHeld ? settings.fastDropSpeed : settings.normalDropSpeed;

        if (running)
            surface.scheduleTick(settings.tickIntervalMs);
    }

    void Game::handleKeyPress(Key key) {
        if (!running)
            return;

        switch (key) {
        case KEY_LEFT:
            if (validMove(-1, 0))
                currentPiece.x -= 1;
            break;
        case KEY_RIGHT:
            if (validMove(1, 0))
                currentPiece.x += 1;
            break;
        case KEY_DOWN:
            // A tap shorter than one tick still gets one fast step.
            downHeld = true;
            dropSpeed = settings.fastDropSpeed;
            break;
        case KEY_UP: {
            Shape original = currentPiece.shape;
            currentPiece.rotate();
            if (!validMove(0, 0))
                currentPiece.shape = original;
            break;
        }
        default:
            break;
        }
    }

    void Game::handleKeyRelease(Key key) {
        if (key == KEY_DOWN)
            downHeld = false;
    }

    void Game::draw() const {
        const int cell = settings.cellSize;
        surface.clear();

        for (int row = 0; row < board.getHeight(); ++row) {
            for (int col = 0; col < board.getWidth(); ++col) {
                if (!board.isEmpty(col, row))
                    surface.fillRect(col * cell, row * cell,
                                     (col + 1) * cell, (row + 1) * cell,
                                     board.cellAt(col, row));
            }
        }

        for (int r = 0; r < currentPiece.height(); ++r) {
            for (int c = 0; c < currentPiece.width(); ++c) {
                if (!currentPiece.occupies(c, r))
                    continue;
                int x = (currentPiece.x + c) * cell;
                int y = currentPiece.pixelY + r * cell;
                surface.fillRect(x, y, x + cell, y + cell, currentPiece.colorIndex);
            }
        }

        if (!running)
            surface.drawText(settings.canvasWidth() / 2, settings.canvasHeight() / 2,
                             "GAME OVER", Color::RED);
    }
}
