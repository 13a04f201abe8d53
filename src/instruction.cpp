#include "instruction.hpp"

#include <utility>

#include <fmt/format.h>

std::string Instruction::to_string() const{
    return fmt::format("{:04X}", raw);
}

static Operation decode_0(const Instruction& instr){
    switch(instr.opcode()){
        case 0x0000: return Operation::NOP;
        case 0x00E0: return Operation::CLEAR_SCREEN;
        case 0x00EE: return Operation::RETURN;
        // 0NNN (machine code routine) is not supported
        default: return Operation::UNKNOWN;
    }
}

static Operation decode_8(const Instruction& instr){
    switch(instr.n()){
        case 0x0: return Operation::SET_REG_REG;
        case 0x1: return Operation::OR_REG;
        case 0x2: return Operation::AND_REG;
        case 0x3: return Operation::XOR_REG;
        case 0x4: return Operation::ADD_REG;
        case 0x5: return Operation::SUB_REG;
        case 0x6: return Operation::SHR_REG;
        case 0x7: return Operation::REV_SUB_REG;
        case 0xE: return Operation::SHL_REG;
        default: return Operation::UNKNOWN;
    }
}

static Operation decode_E(const Instruction& instr){
    switch(instr.nn()){
        case 0x9E: return Operation::SKIP_KEY;
        case 0xA1: return Operation::SKIP_NOT_KEY;
        default: return Operation::UNKNOWN;
    }
}

static Operation decode_F(const Instruction& instr){
    switch(instr.nn()){
        case 0x07: return Operation::GET_DELAY;
        case 0x0A: return Operation::WAIT_KEY;
        case 0x15: return Operation::SET_DELAY;
        case 0x18: return Operation::SET_SOUND;
        case 0x1E: return Operation::ADD_INDEX;
        case 0x29: return Operation::SET_INDEX_CHAR;
        case 0x33: return Operation::STORE_BCD;
        case 0x55: return Operation::STORE_REGS;
        case 0x65: return Operation::LOAD_REGS;
        default: return Operation::UNKNOWN;
    }
}

Operation decode(const Instruction& instr){
    switch(instr.nibbles()[0]){
        case 0x0: return decode_0(instr);
        case 0x1: return Operation::JUMP;
        case 0x2: return Operation::CALL;
        case 0x3: return Operation::SKIP_EQ_BYTE;
        case 0x4: return Operation::SKIP_NOT_BYTE;
        // 5XY0 and 9XY0 only, the last nibble must be zero
        case 0x5: return instr.n() == 0 ? Operation::SKIP_EQ_REG : Operation::UNKNOWN;
        case 0x6: return Operation::SET_REG_BYTE;
        case 0x7: return Operation::ADD_BYTE;
        case 0x8: return decode_8(instr);
        case 0x9: return instr.n() == 0 ? Operation::SKIP_NOT_REG : Operation::UNKNOWN;
        case 0xA: return Operation::SET_INDEX;
        case 0xB: return Operation::JUMP_V0;
        case 0xC: return Operation::RAND;
        case 0xD: return Operation::DRAW;
        case 0xE: return decode_E(instr);
        case 0xF: return decode_F(instr);
    }
    std::unreachable();
}
