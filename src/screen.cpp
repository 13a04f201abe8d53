#include "screen.hpp"

void Screen::clear(){
    pixels.reset();
}

bool Screen::draw_sprite(std::span<const uint8_t> sprite, std::size_t x, std::size_t y){
    x %= WIDTH; // col
    y %= HEIGHT; // row
    bool erased = false;

    std::bitset<8> sprite_row;

    for(std::size_t r = 0; r < sprite.size() && y + r < HEIGHT; ++r){
        sprite_row = sprite[r];

        for(std::size_t c = 0; c < 8 && x + c < WIDTH; ++c){
            std::size_t screen_pix = (y + r) * WIDTH + x + c;
            if(sprite_row.test(7 - c)){
                if(pixels.test(screen_pix)){
                    erased = true;
                }
                pixels.flip(screen_pix);
            }
        }
    }

    return erased;
}

bool Screen::pixel(std::size_t x, std::size_t y) const{
    return pixels.test(y * WIDTH + x);
}
