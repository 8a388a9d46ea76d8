#include <gtest/gtest.h>

#include <stdexcept>

#include "color.h"
#include "config.h"

using namespace Config;

TEST(SettingsTest, Defaults) {
    Settings settings;
    EXPECT_EQ(10, settings.boardWidth);
    EXPECT_EQ(20, settings.boardHeight);
    EXPECT_EQ(30, settings.cellSize);
    EXPECT_EQ(10, settings.tickIntervalMs);
    EXPECT_EQ(1, settings.normalDropSpeed);
    EXPECT_EQ(100, settings.fastDropSpeed);
    EXPECT_EQ(300, settings.canvasWidth());
    EXPECT_EQ(600, settings.canvasHeight());
    EXPECT_EQ(7u, settings.shapes.size());
    EXPECT_EQ(7u, settings.palette.size());
    EXPECT_EQ("Tetris", settings.windowTitle);
    EXPECT_NO_THROW(validate(settings));
}

TEST(SettingsTest, RejectsNonPositiveDimensions) {
    Settings settings;
    settings.boardHeight = 0;
    EXPECT_THROW(validate(settings), std::invalid_argument);

    settings = Settings();
    settings.fastDropSpeed = -5;
    EXPECT_THROW(validate(settings), std::invalid_argument);
}

TEST(SettingsTest, RejectsBadShapes) {
    Settings settings;
    settings.shapes.clear();
    EXPECT_THROW(validate(settings), std::invalid_argument);

    settings.shapes = {{{1, 1}, {1}}};
    EXPECT_THROW(validate(settings), std::invalid_argument);

    settings.shapes = {{{0, 0}, {0, 0}}};
    EXPECT_THROW(validate(settings), std::invalid_argument);

    settings.shapes = {{{1, 2}}};
    EXPECT_THROW(validate(settings), std::invalid_argument);

    settings.boardWidth = 3;
    settings.shapes = {{{1, 1, 1, 1}}};
    EXPECT_THROW(validate(settings), std::invalid_argument);
}

TEST(SettingsTest, RejectsBadPalette) {
    Settings settings;
    settings.palette.clear();
    EXPECT_THROW(validate(settings), std::invalid_argument);

    settings.palette = {Color::EMPTY};
    EXPECT_THROW(validate(settings), std::invalid_argument);
}
