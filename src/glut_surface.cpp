#include "glut_surface.h"

#include <GL/gl.h>
#include <GL/glut.h>

#include "color.h"

using namespace std;

namespace Renderer {

    void setGLColor(int colorIdx) {
        Color::RGB color = Color::getColorRGB(colorIdx);
        glColor3f(color.r, color.g, color.b);
    }

    GlutSurface::GlutSurface(int canvasW, int canvasH, int labelH, void (*onTick)(int))
        : canvasWidth(canvasW), canvasHeight(canvasH), labelHeight(labelH),
          tickCallback(onTick) {}

    void GlutSurface::clear() {
        glClear(GL_COLOR_BUFFER_BIT);

        glColor3f(0.85f, 0.85f, 0.85f);
        glBegin(GL_QUADS);
        glVertex2f(0, 0);
        glVertex2f(canvasWidth, 0);
        glVertex2f(canvasWidth, canvasHeight);
        glVertex2f(0, canvasHeight);
        glEnd();
    }

    void GlutSurface::fillRect(int x1, int y1, int x2, int y2, int colorIdx) {
        setGLColor(colorIdx);
        glBegin(GL_QUADS);
        glVertex2f(x1, y1);
        glVertex2f(x2, y1);
        glVertex2f(x2, y2);
        glVertex2f(x1, y2);
        glEnd();

        // Half-pixel inset keeps the outline on the cell's own pixels.
        setGLColor(Color::BLACK);
        glBegin(GL_LINE_LOOP);
        glVertex2f(x1 + 0.5f, y1 + 0.5f);
        glVertex2f(x2 - 0.5f, y1 + 0.5f);
        glVertex2f(x2 - 0.5f, y2 - 0.5f);
        glVertex2f(x1 + 0.5f, y2 - 0.5f);
        glEnd();
    }

    void GlutSurface::drawString(float x, float y, const string &s) const {
        glRasterPos2f(x, y);
        for (char ch : s)
            glutBitmapCharacter(GLUT_BITMAP_HELVETICA_18, ch);
    }

    void GlutSurface::drawText(int x, int y, const string &text, int colorIdx) {
        int textWidth = 0;
        for (char ch : text)
            textWidth += glutBitmapWidth(GLUT_BITMAP_HELVETICA_18, ch);

        setGLColor(colorIdx);
        // Raster position is the baseline; 18px font, so drop by half of it.
        drawString(x - textWidth / 2.0f, y + 9.0f, text);
    }

    void GlutSurface::setLabel(const string &text) {
        label = text;
    }

    void GlutSurface::requestRedraw() {
        glutPostRedisplay();
    }

    void GlutSurface::scheduleTick(int delayMs) {
        glutTimerFunc(delayMs, tickCallback, 0);
    }

    void GlutSurface::present() {
        if (labelHeight > 0) {
            glColor3f(0.1f, 0.1f, 0.1f);
            glBegin(GL_QUADS);
            glVertex2f(0, canvasHeight);
            glVertex2f(canvasWidth, canvasHeight);
            glVertex2f(canvasWidth, canvasHeight + labelHeight);
            glVertex2f(0, canvasHeight + labelHeight);
            glEnd();

            int textWidth = 0;
            for (char ch : label)
                textWidth += glutBitmapWidth(GLUT_BITMAP_HELVETICA_12, ch);

            setGLColor(Color::WHITE);
            glRasterPos2f((canvasWidth - textWidth) / 2.0f, canvasHeight + labelHeight / 2.0f + 5.0f);
            for (char ch : label)
                glutBitmapCharacter(GLUT_BITMAP_HELVETICA_12, ch);
        }
        glutSwapBuffers();
    }
}
