#include <gtest/gtest.h>

#include "layout.hpp"

TEST(LayoutTest, ParseIsCaseInsensitive){
    EXPECT_EQ(parse_layout("qwerty"), Layout::QWERTY);
    EXPECT_EQ(parse_layout("QWERTY"), Layout::QWERTY);
    EXPECT_EQ(parse_layout("Colemak"), Layout::COLEMAK);
    EXPECT_FALSE(parse_layout("dvorak").has_value());
    EXPECT_FALSE(parse_layout("").has_value());
}

TEST(LayoutTest, Names){
    EXPECT_EQ(layout_name(Layout::QWERTY), "QWERTY");
    EXPECT_EQ(layout_name(Layout::COLEMAK), "Colemak");
}

TEST(LayoutTest, QwertyKeypad){
    EXPECT_EQ(character_to_key(Layout::QWERTY, '1'), 0x1);
    EXPECT_EQ(character_to_key(Layout::QWERTY, '4'), 0xC);
    EXPECT_EQ(character_to_key(Layout::QWERTY, 'q'), 0x4);
    EXPECT_EQ(character_to_key(Layout::QWERTY, 'r'), 0xD);
    EXPECT_EQ(character_to_key(Layout::QWERTY, 's'), 0x8);
    EXPECT_EQ(character_to_key(Layout::QWERTY, 'f'), 0xE);
    EXPECT_EQ(character_to_key(Layout::QWERTY, 'x'), 0x0);
    EXPECT_EQ(character_to_key(Layout::QWERTY, 'v'), 0xF);
    EXPECT_FALSE(character_to_key(Layout::QWERTY, 'p').has_value());
    EXPECT_FALSE(character_to_key(Layout::QWERTY, '5').has_value());
}

TEST(LayoutTest, ColemakKeypad){
    EXPECT_EQ(character_to_key(Layout::COLEMAK, 'f'), 0x6);
    EXPECT_EQ(character_to_key(Layout::COLEMAK, 'p'), 0xD);
    EXPECT_EQ(character_to_key(Layout::COLEMAK, 'r'), 0x8);
    EXPECT_EQ(character_to_key(Layout::COLEMAK, 's'), 0x9);
    EXPECT_EQ(character_to_key(Layout::COLEMAK, 't'), 0xE);
    EXPECT_EQ(character_to_key(Layout::COLEMAK, 'z'), 0xA);
    EXPECT_FALSE(character_to_key(Layout::COLEMAK, 'e').has_value());
}

TEST(LayoutTest, EveryKeyIsReachable){
    for(const Layout layout : {Layout::QWERTY, Layout::COLEMAK}){
        uint16_t seen = 0;
        for(char c = ' '; c <= '~'; ++c){
            if(const auto key = character_to_key(layout, c)){
                seen |= 1 << *key;
            }
        }
        EXPECT_EQ(seen, 0xFFFF) << layout_name(layout);
    }
}
