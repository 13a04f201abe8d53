#include "args.hpp"

#include <charconv>
#include <fstream>
#include <ios>
#include <iterator>
#include <system_error>
#include <utility>

#include <fmt/format.h>

std::string ArgsError::message() const{
    switch(kind){
        case Kind::LAYOUT:
            return fmt::format("Layout \"{}\" doesn't exist (QWERTY and Colemak supported).", detail);
        case Kind::HEX_RGB:
            return fmt::format("Hexadecimal RGB color \"{}\" is incorrect, expected #RRGGBB.", detail);
        case Kind::NUMBER:
            return fmt::format("\"{}\" is not a positive number.", detail);
        case Kind::MISSING_VALUE:
            return fmt::format("Option {} needs a value.", detail);
        case Kind::UNKNOWN_OPTION:
            return fmt::format("Unknown option {}.", detail);
        case Kind::MISSING_PATH:
            return "Missing the path of the ROM to execute.";
        case Kind::IO:
            return fmt::format("Couldn't read the file: {}.", detail);
        case Kind::CHIP8:
            return detail;
    }
    std::unreachable();
}

std::expected<Chip8, ArgsError> Args::chip8() const{
    const auto rom = load_rom(path);
    if(!rom){
        return std::unexpected(rom.error());
    }
    auto c = Chip8::create(*rom);
    if(!c){
        return std::unexpected(ArgsError{ArgsError::Kind::CHIP8, c.error().message()});
    }
    return std::move(*c);
}

static std::expected<int, ArgsError> parse_positive(std::string_view s){
    int value = 0;
    const auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if(ec != std::errc{} || end != s.data() + s.size() || value <= 0){
        return std::unexpected(ArgsError{ArgsError::Kind::NUMBER, std::string(s)});
    }
    return value;
}

std::expected<Args, ArgsError> parse_args(int argc, const char* const* argv){
    Args args;
    bool has_path = false;

    for(int i = 1; i < argc; ++i){
        const std::string_view a = argv[i];

        if(a == "-h" || a == "--help"){
            args.help = true;
            return args;
        }

        if(a == "-l" || a == "--layout" || a == "--bg" || a == "--fg" || a == "--ips"){
            if(i + 1 >= argc){
                return std::unexpected(ArgsError{ArgsError::Kind::MISSING_VALUE, std::string(a)});
            }
            const std::string_view value = argv[++i];

            if(a == "--bg" || a == "--fg"){
                const auto rgb = hex_to_rgb(value);
                if(!rgb){
                    return std::unexpected(rgb.error());
                }
                (a == "--bg" ? args.bg : args.fg) = *rgb;
            }
            else if(a == "--ips"){
                const auto ips = parse_positive(value);
                if(!ips){
                    return std::unexpected(ips.error());
                }
                args.ips = *ips;
            }
            else{
                const auto layout = parse_layout(value);
                if(!layout){
                    return std::unexpected(ArgsError{ArgsError::Kind::LAYOUT, std::string(value)});
                }
                args.layout = *layout;
            }
        }
        else if(a.size() > 1 && a[0] == '-'){
            return std::unexpected(ArgsError{ArgsError::Kind::UNKNOWN_OPTION, std::string(a)});
        }
        else{
            args.path = a;
            has_path = true;
        }
    }

    if(!has_path){
        return std::unexpected(ArgsError{ArgsError::Kind::MISSING_PATH, ""});
    }
    return args;
}

std::string usage(std::string_view argv0){
    return fmt::format(
        "Usage: {} [options] <rom>\n"
        "A CHIP-8 emulator.\n\n"
        "Options:\n"
        "  -l, --layout <name>  keyboard layout, qwerty (default) or colemak\n"
        "  --bg <#RRGGBB>       background color (default #000000)\n"
        "  --fg <#RRGGBB>       foreground color (default #FFFFFF)\n"
        "  --ips <n>            instructions per second (default 700)\n"
        "  -h, --help           show this message\n",
        argv0
    );
}

std::expected<Rgb, ArgsError> hex_to_rgb(std::string_view color){
    const auto fail = std::unexpected(ArgsError{ArgsError::Kind::HEX_RGB, std::string(color)});
    if(color.size() != 7 || color[0] != '#'){
        return fail;
    }

    Rgb rgb;
    for(std::size_t i = 0; i < rgb.size(); ++i){
        const char* first = color.data() + 1 + 2 * i;
        const auto [end, ec] = std::from_chars(first, first + 2, rgb[i], 16);
        if(ec != std::errc{} || end != first + 2){
            return fail;
        }
    }
    return rgb;
}

std::expected<std::vector<uint8_t>, ArgsError> load_rom(const std::filesystem::path& path){
    const auto fail = std::unexpected(ArgsError{ArgsError::Kind::IO, path.string()});

    // a directory opens fine and only fails once read
    std::error_code ec;
    if(!std::filesystem::is_regular_file(path, ec)){
        return fail;
    }

    std::ifstream f(path, std::ios::binary);
    if(!f){
        return fail;
    }

    try{
        std::vector<uint8_t> rom(
            (std::istreambuf_iterator<char>(f)),
            std::istreambuf_iterator<char>()
        );
        if(f.bad()){
            return fail;
        }
        return rom;
    }
    catch(const std::ios_base::failure&){
        return fail;
    }
}
