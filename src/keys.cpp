#include "keys.hpp"

void Keys::press_key(uint8_t key){
    if(key >= KEYBOARD_SIZE){
        return;
    }
    keyboard.set(key);
    last = key;
}

void Keys::release_key(uint8_t key){
    if(key >= KEYBOARD_SIZE){
        return;
    }
    keyboard.reset(key);
}

bool Keys::key_pressed(uint8_t key) const{
    return key < KEYBOARD_SIZE && keyboard.test(key);
}

std::optional<uint8_t> Keys::last_pressed() const{
    return last;
}

void Keys::reset_last_pressed(){
    last.reset();
}
