#pragma once

#include <bitset>
#include <cstddef>
#include <cstdint>
#include <span>

class Screen{
    public:
    static constexpr std::size_t WIDTH = 64;
    static constexpr std::size_t HEIGHT = 32;
    static constexpr std::size_t SIZE = WIDTH * HEIGHT; // row major, origin top left

    private:
    std::bitset<SIZE> pixels;

    public:
    void clear();

    // XOR draws one byte per row starting at (x, y) wrapped onto the screen.
    // Whatever crosses the right or bottom edge is clipped.
    // Returns true if at least one pixel was turned off.
    bool draw_sprite(std::span<const uint8_t> sprite, std::size_t x, std::size_t y);

    // x < WIDTH and y < HEIGHT
    bool pixel(std::size_t x, std::size_t y) const;

    bool operator==(const Screen&) const = default;
};
