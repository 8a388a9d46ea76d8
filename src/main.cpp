// Tetris - grid board, pixel-smooth falling piece
// Build: cmake -S . -B build && cmake --build build

#include <GL/gl.h>
#include <GL/glu.h>
#include <GL/glut.h>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <iostream>

#include "config.h"
#include "game.h"
#include "glut_surface.h"

using namespace std;

// ============================================================================
// GLOBAL GAME INSTANCE
// ============================================================================

Renderer::GlutSurface *surfaceInstance = nullptr;
GameEngine::Game *gameInstance = nullptr;

// ============================================================================
// GLUT CALLBACKS
// ============================================================================

void display() {
    if (gameInstance) {
        gameInstance->draw();
        surfaceInstance->present();
    }
}

void timerFunc(int value) {
    if (gameInstance)
        gameInstance->update();
}

GameEngine::Key toGameKey(int key) {
    switch (key) {
    case GLUT_KEY_LEFT:  return GameEngine::KEY_LEFT;
    case GLUT_KEY_RIGHT: return GameEngine::KEY_RIGHT;
    case GLUT_KEY_DOWN:  return GameEngine::KEY_DOWN;
    case GLUT_KEY_UP:    return GameEngine::KEY_UP;
    default:             return GameEngine::KEY_OTHER;
    }
}

void specialKey(int key, int x, int y) {
    if (!gameInstance) return;

    gameInstance->handleKeyPress(toGameKey(key));
    glutPostRedisplay();
}

void specialKeyUp(int key, int x, int y) {
    if (!gameInstance) return;

    gameInstance->handleKeyRelease(toGameKey(key));
}

void keyboard(unsigned char key, int x, int y) {
    if (key == 27) exit(0);
}

void reshape(int w, int h) {
    glViewport(0, 0, w, h);
    glMatrixMode(GL_PROJECTION);
    glLoadIdentity();
    // Top-left origin, y grows downward like the board rows.
    gluOrtho2D(0, w, h, 0);
    glMatrixMode(GL_MODELVIEW);
    glLoadIdentity();
}

void initGL() {
    glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
    glShadeModel(GL_FLAT);
}

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char **argv) {
    srand((unsigned)time(nullptr));

    Config::Settings settings;
    try {
        Config::validate(settings);
    } catch (const exception &e) {
        cerr << "Invalid settings: " << e.what() << endl;
        return 1;
    }

    glutInit(&argc, argv);
    glutInitDisplayMode(GLUT_DOUBLE | GLUT_RGBA);
    glutInitWindowSize(settings.canvasWidth(), settings.windowHeight());
    glutInitWindowPosition(100, 100);
    glutCreateWindow(settings.windowTitle.c_str());

    initGL();

    surfaceInstance = new Renderer::GlutSurface(settings.canvasWidth(), settings.canvasHeight(),
                                                settings.labelHeight, timerFunc);
    gameInstance = new GameEngine::Game(settings, *surfaceInstance);

    glutIgnoreKeyRepeat(1);
    glutDisplayFunc(display);
    glutReshapeFunc(reshape);
    glutKeyboardFunc(keyboard);
    glutSpecialFunc(specialKey);
    glutSpecialUpFunc(specialKeyUp);
    gameInstance->start();

    glutMainLoop();

    delete gameInstance;
    delete surfaceInstance;
    return 0;
}
