#include "layout.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace {

constexpr std::array<uint8_t, 16> KEYPAD{
    0x1, 0x2, 0x3, 0xC,
    0x4, 0x5, 0x6, 0xD,
    0x7, 0x8, 0x9, 0xE,
    0xA, 0x0, 0xB, 0xF
};

// same positions as KEYPAD
constexpr std::string_view QWERTY_CHARS = "1234qwerasdfzxcv";
constexpr std::string_view COLEMAK_CHARS = "1234qwfparstzxcv";

}

std::optional<Layout> parse_layout(std::string_view name){
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c){ return static_cast<char>(std::tolower(c)); });

    if(lower == "qwerty"){
        return Layout::QWERTY;
    }
    if(lower == "colemak"){
        return Layout::COLEMAK;
    }
    return std::nullopt;
}

std::string_view layout_name(Layout layout){
    switch(layout){
        case Layout::QWERTY: return "QWERTY";
        case Layout::COLEMAK: return "Colemak";
    }
    std::unreachable();
}

std::optional<uint8_t> character_to_key(Layout layout, char character){
    const std::string_view chars = layout == Layout::QWERTY ? QWERTY_CHARS : COLEMAK_CHARS;
    const auto pos = chars.find(character);
    if(pos == std::string_view::npos){
        return std::nullopt;
    }
    return KEYPAD[pos];
}
