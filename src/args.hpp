#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "chip8.hpp"
#include "layout.hpp"

using Rgb = std::array<uint8_t, 3>;

class ArgsError{
    public:
    enum class Kind{
        LAYOUT,
        HEX_RGB,
        NUMBER,
        MISSING_VALUE,
        UNKNOWN_OPTION,
        MISSING_PATH,
        IO,
        CHIP8
    };

    Kind kind;
    std::string detail; // offending argument, file or emulator message

    std::string message() const;
};

// Options of the frontend, the ROM path is the only required argument.
struct Args{
    Layout layout = Layout::QWERTY;
    Rgb bg{0x00, 0x00, 0x00};
    Rgb fg{0xFF, 0xFF, 0xFF};
    int ips = 700; // instruction per second. 700 should be good
    std::filesystem::path path;
    bool help = false;

    // loads the ROM at path and builds an emulator around it
    std::expected<Chip8, ArgsError> chip8() const;
};

std::expected<Args, ArgsError> parse_args(int argc, const char* const* argv);

std::string usage(std::string_view argv0);

// "#RRGGBB"
std::expected<Rgb, ArgsError> hex_to_rgb(std::string_view color);

std::expected<std::vector<uint8_t>, ArgsError> load_rom(const std::filesystem::path& path);
