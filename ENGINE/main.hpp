#pragma once

#include <SDL.h>
#include <memory>
#include <string>
#include <vector>
#include "core/frame_clock.hpp"
#include "utils/default_random_source.hpp"
#include "utils/prandom.hpp"
#include "animation/easing.hpp"

/*
  Demo loop: one bar per configured easing, redrawn every frame from
  Easing::sample(). Space pauses, R restarts, Esc quits.
*/
class MainApp {

	public:
    MainApp(SDL_Renderer* renderer, int screen_w, int screen_h);
    virtual ~MainApp() = default;
    virtual void init();
    virtual void game_loop();
    virtual void setup();
	protected:
    struct Track {
        std::string label;
        Easing       easing;
        Easing::Loop loop;
        SDL_Color    color;
    };

    void handle_key(SDL_Keycode key, bool& quit);
    void restart_tracks();
    void render_tracks();

    SDL_Renderer* renderer_   = nullptr;
    int           screen_w_   = 0;
    int           screen_h_   = 0;
    FrameClock         clock_;
    EngineRandomSource default_random_;
    PRandom            random_;
    std::vector<Track> tracks_;
    bool paused_ = false;
};

void run(SDL_Window* window, SDL_Renderer* renderer, int screen_w, int screen_h);
