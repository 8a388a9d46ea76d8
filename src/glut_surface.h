#ifndef TETRIS_GLUT_SURFACE_H
#define TETRIS_GLUT_SURFACE_H

#include <string>

#include "surface.h"

// ============================================================================
// RENDERER MODULE
// ============================================================================

namespace Renderer {

    // Surface backed by the current GLUT window. Expects a projection with
    // the origin at the top-left corner, one unit per pixel.
    class GlutSurface : public Display::Surface {
    private:
        int canvasWidth;
        int canvasHeight;
        int labelHeight;
        std::string label;
        void (*tickCallback)(int);

        void drawString(float x, float y, const std::string &s) const;

    public:
        GlutSurface(int canvasW, int canvasH, int labelH, void (*onTick)(int));

        void clear() override;
        void fillRect(int x1, int y1, int x2, int y2, int colorIdx) override;
        void drawText(int x, int y, const std::string &text, int colorIdx) override;
        void setLabel(const std::string &text) override;
        void requestRedraw() override;
        void scheduleTick(int delayMs) override;

        // Draws the label strip and swaps buffers; call at the end of a frame.
        void present();
    };

    void setGLColor(int colorIdx);
}

#endif
