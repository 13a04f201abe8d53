#pragma once

#include <bitset>
#include <cstdint>
#include <optional>

// Snapshot of the hex keypad handed to the interpreter every cycle.
class Keys{
    public:
    static constexpr uint8_t KEYBOARD_SIZE = 16; // keys go from 0x0 to 0xF

    private:
    std::bitset<KEYBOARD_SIZE> keyboard;
    std::optional<uint8_t> last;

    public:
    void press_key(uint8_t key);

    // does not forget the last pressed key
    void release_key(uint8_t key);

    // false for anything outside the keypad
    bool key_pressed(uint8_t key) const;

    std::optional<uint8_t> last_pressed() const;

    // the driver calls this once per cycle, after the cycle ran
    void reset_last_pressed();

    bool operator==(const Keys&) const = default;
};
