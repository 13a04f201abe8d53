#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

// Physical keyboard layouts mapped onto the hex keypad:
//   1 2 3 C
//   4 5 6 D
//   7 8 9 E
//   A 0 B F
enum class Layout{
    QWERTY,
    COLEMAK
};

// case insensitive
std::optional<Layout> parse_layout(std::string_view name);

std::string_view layout_name(Layout layout);

// lowercase characters only, anything outside the 4x4 block has no key
std::optional<uint8_t> character_to_key(Layout layout, char character);
