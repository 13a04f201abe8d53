#include "chip8.hpp"

#include <algorithm>
#include <cassert>
#include <utility>

#include <fmt/format.h>

#include "log.hpp"

Chip8Error Chip8Error::rom_too_big(std::size_t exceeding_bytes){
    return Chip8Error{.kind = Kind::ROM_TOO_BIG, .exceeding_bytes = exceeding_bytes};
}

Chip8Error Chip8Error::no_more_instructions(){
    return Chip8Error{.kind = Kind::NO_MORE_INSTRUCTIONS};
}

Chip8Error Chip8Error::unknown_instruction(Instruction instruction, uint16_t pc){
    return Chip8Error{.kind = Kind::UNKNOWN_INSTRUCTION, .instruction = instruction, .pc = pc};
}

std::string Chip8Error::message() const{
    switch(kind){
        case Kind::ROM_TOO_BIG:
            return fmt::format(
                "ROM size exceeds the amount of RAM provided by the CHIP-8 emulator by {} bytes.",
                exceeding_bytes
            );
        case Kind::NO_MORE_INSTRUCTIONS:
            return "There aren't any more instructions to run.";
        case Kind::UNKNOWN_INSTRUCTION:
            return fmt::format(
                "Instruction opcode {} at 0x{:03X} is unknown.", instruction.to_string(), pc
            );
    }
    std::unreachable();
}

std::expected<Chip8, Chip8Error> Chip8::create(std::span<const uint8_t> rom){
    if(rom.size() > MAX_PROG_SIZE){
        return std::unexpected(Chip8Error::rom_too_big(rom.size() - MAX_PROG_SIZE));
    }

    Chip8 c;
    std::copy(rom.begin(), rom.end(), c.ram.begin() + PC_RESET_VALUE);
    return c;
}

uint8_t& Chip8::ram_at(std::size_t addr){
    return ram[addr % RAM_SIZE];
}

void Chip8::decrement_timers(){
    const auto now = std::chrono::steady_clock::now();
    if(now - last_decrement < TIMER_PERIOD){
        return;
    }

    if(delay_timer > 0){
        --delay_timer;
    }
    if(sound_timer > 0){
        --sound_timer;
    }
    last_decrement = now;
}

std::optional<Instruction> Chip8::fetch() const{
    if(static_cast<std::size_t>(PC) + 1 >= RAM_SIZE){
        return std::nullopt;
    }
    return Instruction(ram[PC] << 8 | ram[PC + 1]);
}

std::expected<CycleOutput, Chip8Error> Chip8::instruction_cycle(const Keys& k){
    decrement_timers();

    BISCUIT8_LOGLN(
        "CHIP8 internal state:\n\tPC: 0x{:04X} -  "
        "I: 0x{:04X}",
        PC,
        I
    );
    for(int i = 0; i < GPREG_NUM; i += 4){
        BISCUIT8_LOG("\tV{:0X}: 0x{:02X} - ", i, V[i]);
        BISCUIT8_LOG("V{:0X}: 0x{:02X} - ", i+1, V[i+1]);
        BISCUIT8_LOG("V{:0X}: 0x{:02X} - ", i+2, V[i+2]);
        BISCUIT8_LOGLN("V{:0X}: 0x{:02X}", i+3, V[i+3]);
    }

    // Fetch
    const auto fetched = fetch();
    if(!fetched){
        return std::unexpected(Chip8Error::no_more_instructions());
    }
    instr = *fetched;
    keys = k;
    PC += 2;

    BISCUIT8_LOGLN("Current instruction: 0x{}", instr.to_string());

    // Decode and execute
    const auto redrawn = execute();
    if(!redrawn){
        return std::unexpected(redrawn.error());
    }

    CycleOutput out{.screen = std::nullopt, .beep = sound_timer > 0};
    if(*redrawn){
        out.screen = screen;
    }
    return out;
}

std::expected<bool, Chip8Error> Chip8::execute(){
    const Operation op = decode(instr);
    switch(op){
        case Operation::NOP:
        break;
        // clear screen
        case Operation::CLEAR_SCREEN:
            screen.clear();
            return true;
        // return from subroutine
        case Operation::RETURN:
            handle_return();
        break;
        // 1NNN, JMP
        case Operation::JUMP:
            PC = instr.nnn();
        break;
        // 2NNN, jump to subroutine
        case Operation::CALL:
            stack.push_back(PC);
            PC = instr.nnn();
        break;
        // 3XNN, skip conditionally
        case Operation::SKIP_EQ_BYTE:
            if(V[instr.x()] == instr.nn()){
                PC += 2;
            }
        break;
        // 4XNN, skip conditionally
        case Operation::SKIP_NOT_BYTE:
            if(V[instr.x()] != instr.nn()){
                PC += 2;
            }
        break;
        // 5XY0, skip conditionally
        case Operation::SKIP_EQ_REG:
            if(V[instr.x()] == V[instr.y()]){
                PC += 2;
            }
        break;
        // 6XNN, set register
        case Operation::SET_REG_BYTE:
            V[instr.x()] = instr.nn();
        break;
        // 7XNN, add to register, VF untouched
        case Operation::ADD_BYTE:
            V[instr.x()] += instr.nn();
        break;
        case Operation::SET_REG_REG:
        case Operation::OR_REG:
        case Operation::AND_REG:
        case Operation::XOR_REG:
        case Operation::ADD_REG:
        case Operation::SUB_REG:
        case Operation::SHR_REG:
        case Operation::REV_SUB_REG:
        case Operation::SHL_REG:
            handle_8_instr(op);
        break;
        // 9XY0, skip conditionally
        case Operation::SKIP_NOT_REG:
            if(V[instr.x()] != V[instr.y()]){
                PC += 2;
            }
        break;
        // ANNN, I = NNN
        case Operation::SET_INDEX:
            I = instr.nnn();
        break;
        // BNNN, PC = NNN + V0
        case Operation::JUMP_V0:
            PC = instr.nnn() + V[0];
        break;
        // CXNN, VX = rand() & NN
        case Operation::RAND:{
            std::uniform_int_distribution<int> distrib(0, 255);
            V[instr.x()] = distrib(gen) & instr.nn();
        }
        break;
        // DXYN, draw sprite on screen
        case Operation::DRAW:
            handle_draw();
            return true;
        // EX9E, skip if key
        case Operation::SKIP_KEY:
            if(keys.key_pressed(V[instr.x()])){
                PC += 2;
            }
        break;
        // EXA1, skip if NOT key
        case Operation::SKIP_NOT_KEY:
            if(!keys.key_pressed(V[instr.x()])){
                PC += 2;
            }
        break;
        // FX07, reads delay timer and stores it into V[X]
        case Operation::GET_DELAY:
            V[instr.x()] = delay_timer;
        break;
        // FX0A, wait until a key is pressed and store it in V[X]
        case Operation::WAIT_KEY:
            handle_wait_key();
        break;
        // FX15, sets delay timer to V[X]
        case Operation::SET_DELAY:
            delay_timer = V[instr.x()];
        break;
        // FX18, sets sound timer to V[X]
        case Operation::SET_SOUND:
            sound_timer = V[instr.x()];
        break;
        // FX1E, add V[X] to I
        case Operation::ADD_INDEX:
            I += V[instr.x()];
        break;
        // FX29, set I to the beginning of the system font char stored in VX
        case Operation::SET_INDEX_CHAR:
            I = FONT_START_ADDR + FONT_CHAR_SIZE * V[instr.x()];
        break;
        case Operation::STORE_BCD:
            handle_store_bcd();
        break;
        case Operation::STORE_REGS:
            handle_store_regs();
        break;
        case Operation::LOAD_REGS:
            handle_load_regs();
        break;
        case Operation::UNKNOWN:
            BISCUIT8_LOGLN("Unknown instruction 0x{} at 0x{:03X}", instr.to_string(), PC - 2);
            return std::unexpected(Chip8Error::unknown_instruction(instr, PC));
    }
    return false;
}

void Chip8::handle_return(){
    // only a malformed ROM returns with nothing to return to
    assert(!stack.empty());
    PC = stack.back();
    stack.pop_back();
}

void Chip8::handle_8_instr(Operation op){
    uint8_t& vx = V[instr.x()];
    const uint8_t vy = V[instr.y()];
    uint8_t flag = 0;
    switch(op){
        // 8XY0, X = Y
        case Operation::SET_REG_REG:
            vx = vy;
        return;
        // 8XY1, X |= Y, VF reset
        case Operation::OR_REG:
            vx |= vy;
        break;
        // 8XY2, X &= Y, VF reset
        case Operation::AND_REG:
            vx &= vy;
        break;
        // 8XY3, X ^= Y, VF reset
        case Operation::XOR_REG:
            vx ^= vy;
        break;
        // 8XY4, X += Y, VF set to 1 in case of overflow
        case Operation::ADD_REG:
            flag = vx + vy > 0xFF;
            vx += vy;
        break;
        // 8XY5, X -= Y, VF set to 0 in case of underflow
        case Operation::SUB_REG:
            flag = vx >= vy;
            vx -= vy;
        break;
        // 8XY6, X = Y >> 1, VF set to the bit shifted out of X
        case Operation::SHR_REG:
            flag = vx & 0x1;
            vx = vy >> 1;
        break;
        // 8XY7, X = Y - X, VF set to 0 in case of underflow
        case Operation::REV_SUB_REG:
            flag = vy >= vx;
            vx = vy - vx;
        break;
        // 8XYE, X = Y << 1, VF set to the bit shifted out of X
        case Operation::SHL_REG:
            flag = (vx >> 7) & 0x1;
            vx = vy << 1;
        break;
        default:
            BISCUIT8_LOGLN("Unreachable: instruction 0x{}", instr.to_string());
            std::unreachable();
    }
    // written last, VF may be X or Y
    V[0xF] = flag;
}

void Chip8::handle_draw(){
    // DXYN, N rows read from ram[I]
    std::array<uint8_t, 0xF> sprite{};
    for(uint8_t r = 0; r < instr.n(); ++r){
        sprite[r] = ram_at(I + r);
    }
    V[0xF] = screen.draw_sprite(
        std::span<const uint8_t>(sprite.data(), instr.n()),
        V[instr.x()],
        V[instr.y()]
    );
}

void Chip8::handle_wait_key(){
    if(const auto key = keys.last_pressed()){
        V[instr.x()] = *key;
        return;
    }
    // trick to keep waiting while no keys are being pressed
    PC -= 2;
}

void Chip8::handle_store_bcd(){
    // FX33, convert V[X] to decimal and store the result
    // (always 3 digits) into ram[I], ram[I+1], ram[I+2]
    const uint8_t vx = V[instr.x()];
    ram_at(I) = (vx / 100) % 10;
    ram_at(I + 1) = (vx / 10) % 10;
    ram_at(I + 2) = vx % 10;
}

void Chip8::handle_store_regs(){
    // FX55, store registers [V[0], V[X]] to [ram[I], ram[I + X]]
    for(int i = 0; i <= instr.x(); ++i){
        ram_at(I + i) = V[i];
    }
    I += instr.x() + 1;
}

void Chip8::handle_load_regs(){
    // FX65, load registers [V[0], V[X]] from [ram[I], ram[I + X]]
    for(int i = 0; i <= instr.x(); ++i){
        V[i] = ram_at(I + i);
    }
    I += instr.x() + 1;
}

uint16_t Chip8::get_pc() const{
    return PC;
}

uint16_t Chip8::get_index() const{
    return I;
}

uint8_t Chip8::get_register(uint8_t x) const{
    return V[x & 0xF];
}

uint8_t Chip8::get_delay_timer() const{
    return delay_timer;
}

uint8_t Chip8::get_sound_timer() const{
    return sound_timer;
}

std::size_t Chip8::get_stack_size() const{
    return stack.size();
}

uint8_t Chip8::get_memory(uint16_t addr) const{
    return ram[addr % RAM_SIZE];
}

const Screen& Chip8::get_screen() const{
    return screen;
}
