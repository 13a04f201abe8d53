#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <vector>

#include "instruction.hpp"
#include "keys.hpp"
#include "screen.hpp"

class Chip8Error{
    public:
    enum class Kind{
        ROM_TOO_BIG,            // only at construction
        NO_MORE_INSTRUCTIONS,   // PC ran past the end of RAM, the program is over
        UNKNOWN_INSTRUCTION
    };

    Kind kind;
    std::size_t exceeding_bytes = 0; // ROM_TOO_BIG
    Instruction instruction{};       // UNKNOWN_INSTRUCTION
    uint16_t pc = 0;                 // UNKNOWN_INSTRUCTION, already incremented

    static Chip8Error rom_too_big(std::size_t exceeding_bytes);
    static Chip8Error no_more_instructions();
    static Chip8Error unknown_instruction(Instruction instruction, uint16_t pc);

    std::string message() const;

    bool operator==(const Chip8Error&) const = default;
};

struct CycleOutput{
    std::optional<Screen> screen; // set only when the cycle redrew the screen
    bool beep;
};

class Chip8{
    /*
        https://tobiasvl.github.io/blog/write-a-chip-8-emulator/

        https://riv.dev/emulating-a-computer-part-4/
    */

    public:
    static constexpr std::size_t RAM_SIZE = 0x1000; // bytes
    static constexpr uint16_t PC_RESET_VALUE = 0x200; // ROM is loaded here
    static constexpr std::size_t MAX_PROG_SIZE = RAM_SIZE - PC_RESET_VALUE; // bytes
    static constexpr uint8_t FONT_START_ADDR = 0; // sys fonts stored here in ram
    static constexpr uint8_t FONT_CHAR_SIZE = 5; // bytes per sprite
    static constexpr auto GPREG_NUM = 16;
    static constexpr auto TIMER_PERIOD = std::chrono::nanoseconds(16'666'666); // 60 Hz

    private:
    std::array<uint8_t, RAM_SIZE> ram{
        0xF0, 0x90, 0x90, 0x90, 0xF0, // 0
        0x20, 0x60, 0x20, 0x20, 0x70, // 1
        0xF0, 0x10, 0xF0, 0x80, 0xF0, // 2
        0xF0, 0x10, 0xF0, 0x10, 0xF0, // 3
        0x90, 0x90, 0xF0, 0x10, 0x10, // 4
        0xF0, 0x80, 0xF0, 0x10, 0xF0, // 5
        0xF0, 0x80, 0xF0, 0x90, 0xF0, // 6
        0xF0, 0x10, 0x20, 0x40, 0x40, // 7
        0xF0, 0x90, 0xF0, 0x90, 0xF0, // 8
        0xF0, 0x90, 0xF0, 0x10, 0xF0, // 9
        0xF0, 0x90, 0xF0, 0x90, 0x90, // A
        0xE0, 0x90, 0xE0, 0x90, 0xE0, // B
        0xF0, 0x80, 0x80, 0x80, 0xF0, // C
        0xE0, 0x90, 0x90, 0x90, 0xE0, // D
        0xF0, 0x80, 0xF0, 0x80, 0xF0, // E
        0xF0, 0x80, 0xF0, 0x80, 0x80  // F
    };
    uint16_t PC = PC_RESET_VALUE;
    uint16_t I = 0;
    std::array<uint8_t, GPREG_NUM> V{};
    std::vector<uint16_t> stack;
    uint8_t delay_timer = 0;
    uint8_t sound_timer = 0;

    Instruction instr;
    Keys keys;
    Screen screen;

    std::chrono::steady_clock::time_point last_decrement = std::chrono::steady_clock::now();
    std::mt19937 gen{std::random_device{}()};

    Chip8() = default;

    void decrement_timers();
    std::optional<Instruction> fetch() const;
    // returns whether the screen was redrawn
    std::expected<bool, Chip8Error> execute();

    // every access through I wraps around the RAM
    uint8_t& ram_at(std::size_t addr);

    void handle_return();
    void handle_8_instr(Operation op);
    void handle_draw();
    void handle_wait_key();
    void handle_store_bcd();
    void handle_store_regs();
    void handle_load_regs();

    public:
    // fails with ROM_TOO_BIG if the ROM does not fit past PC_RESET_VALUE
    static std::expected<Chip8, Chip8Error> create(std::span<const uint8_t> rom);

    // One fetch-decode-execute step, see CycleOutput.
    // Timers are decremented first if a 60th of a second went by.
    std::expected<CycleOutput, Chip8Error> instruction_cycle(const Keys& keys);

    uint16_t get_pc() const;
    uint16_t get_index() const;
    uint8_t get_register(uint8_t x) const;
    uint8_t get_delay_timer() const;
    uint8_t get_sound_timer() const;
    std::size_t get_stack_size() const;
    uint8_t get_memory(uint16_t addr) const;
    const Screen& get_screen() const;
};
