#ifndef TETRIS_TESTS_FAKE_SURFACE_H
#define TETRIS_TESTS_FAKE_SURFACE_H

#include <string>
#include <vector>

#include "surface.h"

// Records everything the game asks of its surface.
class FakeSurface : public Display::Surface {
public:
    struct Rect {
        int x1, y1, x2, y2, colorIdx;
    };

    struct Text {
        int x, y;
        std::string text;
        int colorIdx;
    };

    int clears = 0;
    int redraws = 0;
    std::vector<Rect> rects;
    std::vector<Text> texts;
    std::string label;
    std::vector<int> scheduledTicks;

    void clear() override {
        ++clears;
        rects.clear();
        texts.clear();
    }

    void fillRect(int x1, int y1, int x2, int y2, int colorIdx) override {
        rects.push_back(Rect{x1, y1, x2, y2, colorIdx});
    }

    void drawText(int x, int y, const std::string &text, int colorIdx) override {
        texts.push_back(Text{x, y, text, colorIdx});
    }

    void setLabel(const std::string &text) override { label = text; }
    void requestRedraw() override { ++redraws; }
    void scheduleTick(int delayMs) override { scheduledTicks.push_back(delayMs); }
};

#endif
