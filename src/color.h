#ifndef TETRIS_COLOR_H
#define TETRIS_COLOR_H

// ============================================================================
// COLOR MODULE
// ============================================================================

namespace Color {
    // Board cells store these indices; EMPTY marks a free cell.
    enum ColorType {
        EMPTY = 0,
        CYAN = 1,
        YELLOW = 2,
        PURPLE = 3,
        GREEN = 4,
        RED = 5,
        BLUE = 6,
        ORANGE = 7,
        BLACK = 8,
        WHITE = 9
    };

    struct RGB {
        float r, g, b;
        RGB(float _r = 0, float _g = 0, float _b = 0) : r(_r), g(_g), b(_b) {}
    };

    inline bool isKnownColor(int colorIdx) {
        return colorIdx >= CYAN && colorIdx <= WHITE;
    }

    inline RGB getColorRGB(int colorIdx) {
        switch (colorIdx) {
        case CYAN:   return RGB(0.0f, 1.0f, 1.0f);
        case YELLOW: return RGB(1.0f, 1.0f, 0.0f);
        case PURPLE: return RGB(0.5f, 0.0f, 0.5f);
        case GREEN:  return RGB(0.0f, 0.5f, 0.0f);
        case RED:    return RGB(1.0f, 0.0f, 0.0f);
        case BLUE:   return RGB(0.0f, 0.0f, 1.0f);
        case ORANGE: return RGB(1.0f, 0.65f, 0.0f);
        case BLACK:  return RGB(0.0f, 0.0f, 0.0f);
        case WHITE:  return RGB(1.0f, 1.0f, 1.0f);
        default:     return RGB(0.5f, 0.5f, 0.5f);
        }
    }
}

#endif
