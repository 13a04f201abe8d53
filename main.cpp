#include <algorithm>
#include <chrono>
#include <cstdio>
#include <optional>
#include <string>
#include <utility>

#include <fmt/core.h>

#include "SDL3/SDL.h"
#include "SDL3/SDL_main.h"

#include "args.hpp"
#include "chip8.hpp"
#include "keys.hpp"
#include "layout.hpp"
#include "log.hpp"
#include "screen.hpp"

namespace {

constexpr int PIXEL_SCALE = 20;
constexpr int REFRESH_RATE = 60; // FPS
constexpr float FRAME_MS = 1000.f / REFRESH_RATE;
constexpr int AUDIO_FREQ = 8100;
constexpr int TONE_FREQ = 440;

// square wave at TONE_FREQ, paused and resumed with the sound timer
void SDLCALL callback(void *userdata, SDL_AudioStream *astream, int additional_amount, int total_amount){
    static int square_sample = 0;
    additional_amount /= sizeof (float);  /* bytes to samples */
    while (additional_amount > 0){
        float samples[128];
        const int total = SDL_min(additional_amount, SDL_arraysize(samples));
        const int half_period = AUDIO_FREQ / TONE_FREQ / 2;
        const float volume = .25;

        for (int i = 0; i < total; i++){
            samples[i] = (square_sample / half_period) % 2 ? volume : -volume;
            square_sample++;
        }

        // one period later the wave starts over
        square_sample %= 2 * half_period;

        SDL_PutAudioStreamData(astream, samples, total * sizeof (float));
        additional_amount -= total;
    }
}

// Owns the SDL side of the emulator: window, renderer, audio and the keypad.
class Frontend{
    Chip8 chip8;
    Args args;
    Keys keys;
    Screen screen;

    SDL_Window *window = nullptr;
    SDL_Renderer *renderer = nullptr;
    SDL_AudioStream *stream = nullptr;

    void handle_key(const SDL_KeyboardEvent& event);
    void render();
    void beep(bool on);

    public:
    Frontend(Chip8 chip8, Args args) : chip8(std::move(chip8)), args(std::move(args)) {}
    ~Frontend();
    Frontend(const Frontend&) = delete;
    Frontend& operator=(const Frontend&) = delete;

    bool init();
    // returns the process exit code
    int main_loop();
};

Frontend::~Frontend(){
    if(stream){
        SDL_DestroyAudioStream(stream);
    }
    if(renderer){
        SDL_DestroyRenderer(renderer);
    }
    if(window){
        SDL_DestroyWindow(window);
    }
    SDL_Quit();
}

bool Frontend::init(){
    const SDL_AudioSpec spec{
        .format = SDL_AUDIO_F32,
        .channels = 1,
        .freq = AUDIO_FREQ,
    };

    // init video / audio
    if(!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_AUDIO)){
        SDL_Log("Couldn't initialize SDL: %s", SDL_GetError());
        return false;
    }

    const std::string title = fmt::format("{} - biscuit8", args.path.filename().string());
    if(!SDL_CreateWindowAndRenderer(
        title.c_str(),
        Screen::WIDTH * PIXEL_SCALE,
        Screen::HEIGHT * PIXEL_SCALE,
        0,
        &window,
        &renderer
    )){
        SDL_Log("Couldn't create window/renderer: %s", SDL_GetError());
        return false;
    }

    stream = SDL_OpenAudioDeviceStream(SDL_AUDIO_DEVICE_DEFAULT_PLAYBACK, &spec, callback, nullptr);
    if(!stream){
        SDL_Log("Couldn't create audio stream: %s", SDL_GetError());
        return false;
    }

    render();
    return true;
}

void Frontend::handle_key(const SDL_KeyboardEvent& event){
    // letters and digits are their lowercase ascii value
    if(event.repeat || event.key > 0x7F){
        return;
    }
    const auto key = character_to_key(args.layout, static_cast<char>(event.key));
    if(!key){
        return;
    }

    if(event.down){
        keys.press_key(*key);
    }
    else{
        keys.release_key(*key);
    }
}

void Frontend::render(){
    SDL_SetRenderDrawColor(renderer, args.bg[0], args.bg[1], args.bg[2], SDL_ALPHA_OPAQUE);
    SDL_RenderClear(renderer);
    SDL_SetRenderDrawColor(renderer, args.fg[0], args.fg[1], args.fg[2], SDL_ALPHA_OPAQUE);

    for(std::size_t y = 0; y < Screen::HEIGHT; ++y){
        for(std::size_t x = 0; x < Screen::WIDTH; ++x){
            if(screen.pixel(x, y)){
                const SDL_FRect rect = {
                    static_cast<float>(PIXEL_SCALE * x),
                    static_cast<float>(PIXEL_SCALE * y),
                    PIXEL_SCALE,
                    PIXEL_SCALE
                };
                SDL_RenderFillRect(renderer, &rect);
            }
        }
    }
    SDL_RenderPresent(renderer);
}

void Frontend::beep(bool on){
    if(on){
        SDL_ResumeAudioStreamDevice(stream);
    }
    else{
        SDL_PauseAudioStreamDevice(stream);
    }
}

int Frontend::main_loop(){
    const int cycles_per_frame = std::max(1, args.ips / REFRESH_RATE);

    while(true){
        // read key events and update keyboard
        SDL_Event event;
        while(SDL_PollEvent(&event)){
            if(event.type == SDL_EVENT_QUIT){
                return 0;
            }
            if(event.type == SDL_EVENT_KEY_DOWN || event.type == SDL_EVENT_KEY_UP){
                handle_key(event.key);
            }
        }

        const auto start = std::chrono::steady_clock::now();
        bool redraw = false;
        bool sound = false;
        for(int i = 0; i < cycles_per_frame; ++i){
            const auto out = chip8.instruction_cycle(keys);
            keys.reset_last_pressed();
            if(!out){
                if(out.error().kind == Chip8Error::Kind::NO_MORE_INSTRUCTIONS){
                    SDL_Log("Successfully finished executing ROM.");
                    return 0;
                }
                SDL_Log("%s", out.error().message().c_str());
                return 1;
            }
            if(out->screen){
                screen = *out->screen;
                redraw = true;
            }
            sound = out->beep;
        }

        if(redraw){
            render();
        }
        beep(sound);

        const float active_time = std::chrono::duration<float, std::milli>(
            std::chrono::steady_clock::now() - start
        ).count();
        SDL_Delay(active_time < FRAME_MS ? static_cast<Uint32>(FRAME_MS - active_time) : 0);
    }
}

}

int main(int argc, char** argv){
    const auto args = parse_args(argc, argv);
    if(!args){
        std::fprintf(stderr, "%s\n\n%s", args.error().message().c_str(), usage(argv[0]).c_str());
        return 1;
    }
    if(args->help){
        std::fputs(usage(argv[0]).c_str(), stdout);
        return 0;
    }

    auto c = args->chip8();
    if(!c){
        SDL_Log("Error while setting up CHIP-8 emulator with ROM file \"%s\": %s",
            args->path.string().c_str(),
            c.error().message().c_str()
        );
        return 1;
    }
    BISCUIT8_LOGLN("Layout: {}, {} instructions per second", layout_name(args->layout), args->ips);

    Frontend frontend(std::move(*c), *args);
    if(!frontend.init()){
        return 1;
    }
    return frontend.main_loop();
}
