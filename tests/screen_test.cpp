#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <cstddef>

#include "screen.hpp"

namespace {

std::size_t lit_pixels(const Screen& screen){
    std::size_t count = 0;
    for(std::size_t y = 0; y < Screen::HEIGHT; ++y){
        for(std::size_t x = 0; x < Screen::WIDTH; ++x){
            count += screen.pixel(x, y);
        }
    }
    return count;
}

}

TEST(ScreenTest, StartsBlank){
    Screen screen;
    EXPECT_EQ(lit_pixels(screen), 0u);
}

TEST(ScreenTest, DrawsBitsLeftToRight){
    Screen screen;
    const std::array<uint8_t, 2> sprite{0b10000001, 0b01000000};
    EXPECT_FALSE(screen.draw_sprite(sprite, 2, 3));

    EXPECT_TRUE(screen.pixel(2, 3));
    EXPECT_TRUE(screen.pixel(9, 3));
    EXPECT_TRUE(screen.pixel(3, 4));
    EXPECT_FALSE(screen.pixel(3, 3));
    EXPECT_EQ(lit_pixels(screen), 3u);
}

TEST(ScreenTest, SecondDrawErasesAndReportsCollision){
    Screen screen;
    const std::array<uint8_t, 1> sprite{0xF0};
    EXPECT_FALSE(screen.draw_sprite(sprite, 0, 0));
    EXPECT_TRUE(screen.draw_sprite(sprite, 0, 0));
    EXPECT_EQ(lit_pixels(screen), 0u);
}

TEST(ScreenTest, OverlapWithoutErasingIsNoCollision){
    Screen screen;
    const std::array<uint8_t, 1> left{0xF0};
    const std::array<uint8_t, 1> right{0x0F};
    EXPECT_FALSE(screen.draw_sprite(left, 0, 0));
    EXPECT_FALSE(screen.draw_sprite(right, 0, 0));
    EXPECT_EQ(lit_pixels(screen), 8u);
}

TEST(ScreenTest, ClipsAtRightEdge){
    Screen screen;
    const std::array<uint8_t, 1> sprite{0xFF};
    screen.draw_sprite(sprite, 60, 0);

    for(std::size_t x = 60; x < 64; ++x){
        EXPECT_TRUE(screen.pixel(x, 0));
    }
    for(std::size_t x = 0; x < 4; ++x){
        EXPECT_FALSE(screen.pixel(x, 0));
    }
    EXPECT_EQ(lit_pixels(screen), 4u);
}

TEST(ScreenTest, ClipsAtBottomEdge){
    Screen screen;
    const std::array<uint8_t, 4> sprite{0x80, 0x80, 0x80, 0x80};
    screen.draw_sprite(sprite, 0, 30);

    EXPECT_TRUE(screen.pixel(0, 30));
    EXPECT_TRUE(screen.pixel(0, 31));
    EXPECT_FALSE(screen.pixel(0, 0));
    EXPECT_FALSE(screen.pixel(0, 1));
    EXPECT_EQ(lit_pixels(screen), 2u);
}

TEST(ScreenTest, StartingPositionWraps){
    Screen screen;
    const std::array<uint8_t, 1> sprite{0x80};
    screen.draw_sprite(sprite, 64 + 5, 32 + 7);
    EXPECT_TRUE(screen.pixel(5, 7));
    EXPECT_EQ(lit_pixels(screen), 1u);
}

TEST(ScreenTest, ClearTurnsEverythingOff){
    Screen screen;
    const std::array<uint8_t, 3> sprite{0xFF, 0xFF, 0xFF};
    screen.draw_sprite(sprite, 10, 10);
    ASSERT_GT(lit_pixels(screen), 0u);

    screen.clear();
    EXPECT_EQ(lit_pixels(screen), 0u);
    EXPECT_EQ(screen, Screen{});
}
