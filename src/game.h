#ifndef TETRIS_GAME_H
#define TETRIS_GAME_H

#include "board.h"
#include "config.h"
#include "surface.h"
#include "tetromino.h"

// ============================================================================
// GAME ENGINE MODULE
// ============================================================================

namespace GameEngine {

    enum Key { KEY_LEFT, KEY_RIGHT, KEY_DOWN, KEY_UP, KEY_OTHER };

    class Game {
    private:
        const Config::Settings settings;
        Display::Surface &surface;
        Board::GameBoard board;
        Tetromino::Piece currentPiece;
        int score;
        int linesClearedTotal;
        bool running;
        bool downHeld;
        int dropSpeed;

        void gameOver();
        void updateScoreLabel();

    public:
        // Throws std::invalid_argument if the settings do not validate.
        Game(const Config::Settings &settings, Display::Surface &surface);

        // Runs the first tick right away; it schedules the rest.
        void start();

        // One gravity step; reschedules itself while the game is running.
        void update();

        void handleKeyPress(Key key);
        void handleKeyRelease(Key key);

        // Emits the board, the falling piece and, once over, the game over
        // text to the surface.
        void draw() const;

        void spawnPiece();
        bool validMove(int dx, int dy) const;
        void lockPiece();
        int clearFullRows();

        const Config::Settings& getSettings() const { return settings; }
        Board::GameBoard& getBoard() { return board; }
        const Board::GameBoard& getBoard() const { return board; }
        const Tetromino::Piece& getCurrentPiece() const { return currentPiece; }
        void setCurrentPiece(const Tetromino::Piece &piece) { currentPiece = piece; }
        int getScore() const { return score; }
        int getLinesClearedTotal() const { return linesClearedTotal; }
        int getDropSpeed() const { return dropSpeed; }
        bool isRunning() const { return running; }
        bool isDownHeld() const { return downHeld; }
    };
}

#endif
