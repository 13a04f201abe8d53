#pragma once

#include <array>
#include <cstdint>
#include <string>

// Every 16 bit value is an instruction, only some of them are known opcodes.
class Instruction{
    uint16_t raw;

    public:
    constexpr explicit Instruction(uint16_t raw = 0) : raw(raw) {}

    constexpr uint16_t opcode() const { return raw; }

    // from most to least significant
    constexpr std::array<uint8_t, 4> nibbles() const{
        return {
            static_cast<uint8_t>((raw >> 12) & 0xF),
            static_cast<uint8_t>((raw >> 8) & 0xF),
            static_cast<uint8_t>((raw >> 4) & 0xF),
            static_cast<uint8_t>(raw & 0xF)
        };
    }

    constexpr uint8_t x() const { return (raw >> 8) & 0xF; }
    constexpr uint8_t y() const { return (raw >> 4) & 0xF; }
    constexpr uint8_t n() const { return raw & 0xF; }
    constexpr uint8_t nn() const { return raw & 0xFF; }
    constexpr uint16_t nnn() const { return raw & 0xFFF; }

    // 4 uppercase hex digits, e.g. "00E0"
    std::string to_string() const;

    constexpr bool operator==(const Instruction&) const = default;
};

// One variant per known opcode, see Chip8::execute()
enum class Operation{
    NOP,                // 0000
    CLEAR_SCREEN,       // 00E0
    RETURN,             // 00EE
    JUMP,               // 1NNN
    CALL,               // 2NNN
    SKIP_EQ_BYTE,       // 3XNN
    SKIP_NOT_BYTE,      // 4XNN
    SKIP_EQ_REG,        // 5XY0
    SET_REG_BYTE,       // 6XNN
    ADD_BYTE,           // 7XNN
    SET_REG_REG,        // 8XY0
    OR_REG,             // 8XY1
    AND_REG,            // 8XY2
    XOR_REG,            // 8XY3
    ADD_REG,            // 8XY4
    SUB_REG,            // 8XY5
    SHR_REG,            // 8XY6
    REV_SUB_REG,        // 8XY7
    SHL_REG,            // 8XYE
    SKIP_NOT_REG,       // 9XY0
    SET_INDEX,          // ANNN
    JUMP_V0,            // BNNN
    RAND,               // CXNN
    DRAW,               // DXYN
    SKIP_KEY,           // EX9E
    SKIP_NOT_KEY,       // EXA1
    GET_DELAY,          // FX07
    WAIT_KEY,           // FX0A
    SET_DELAY,          // FX15
    SET_SOUND,          // FX18
    ADD_INDEX,          // FX1E
    SET_INDEX_CHAR,     // FX29
    STORE_BCD,          // FX33
    STORE_REGS,         // FX55
    LOAD_REGS,          // FX65
    UNKNOWN
};

Operation decode(const Instruction& instr);
