#include <gtest/gtest.h>

#include <cstdint>

#include "keys.hpp"

TEST(KeysTest, NothingPressedByDefault){
    Keys keys;
    for(uint8_t k = 0; k < Keys::KEYBOARD_SIZE; ++k){
        EXPECT_FALSE(keys.key_pressed(k));
    }
    EXPECT_FALSE(keys.last_pressed().has_value());
}

TEST(KeysTest, PressAndRelease){
    Keys keys;
    keys.press_key(0xA);
    EXPECT_TRUE(keys.key_pressed(0xA));
    EXPECT_FALSE(keys.key_pressed(0xB));

    keys.release_key(0xA);
    EXPECT_FALSE(keys.key_pressed(0xA));
}

TEST(KeysTest, ReleaseKeepsLastPressed){
    Keys keys;
    keys.press_key(0x3);
    keys.release_key(0x3);
    ASSERT_TRUE(keys.last_pressed().has_value());
    EXPECT_EQ(*keys.last_pressed(), 0x3);
}

TEST(KeysTest, LastPressedIsMostRecent){
    Keys keys;
    keys.press_key(0x1);
    keys.press_key(0xF);
    EXPECT_EQ(*keys.last_pressed(), 0xF);
    EXPECT_TRUE(keys.key_pressed(0x1));
    EXPECT_TRUE(keys.key_pressed(0xF));
}

TEST(KeysTest, ResetOnlyForgetsLastPressed){
    Keys keys;
    keys.press_key(0x7);
    keys.reset_last_pressed();
    EXPECT_FALSE(keys.last_pressed().has_value());
    EXPECT_TRUE(keys.key_pressed(0x7));
}

TEST(KeysTest, OutsideKeypadIsIgnored){
    Keys keys;
    keys.press_key(0x10);
    EXPECT_FALSE(keys.last_pressed().has_value());
    EXPECT_FALSE(keys.key_pressed(0x10));
    EXPECT_FALSE(keys.key_pressed(0xFF));
}
