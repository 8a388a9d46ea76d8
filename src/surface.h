#ifndef TETRIS_SURFACE_H
#define TETRIS_SURFACE_H

#include <string>

// ============================================================================
// DISPLAY MODULE
// ============================================================================

namespace Display {

    // What the game needs from a window: a canvas in pixel coordinates with
    // the origin at the top-left, a text label, and one-shot timers.
    class Surface {
    public:
        virtual ~Surface() {}

        virtual void clear() = 0;
        // Filled rectangle from (x1, y1) to (x2, y2) with a dark outline.
        virtual void fillRect(int x1, int y1, int x2, int y2, int colorIdx) = 0;
        // Text centered on (x, y).
        virtual void drawText(int x, int y, const std::string &text, int colorIdx) = 0;
        virtual void setLabel(const std::string &text) = 0;

        virtual void requestRedraw() = 0;
        // Fires the tick callback once, delayMs from now.
        virtual void scheduleTick(int delayMs) = 0;
    };
}

#endif
