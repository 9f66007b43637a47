#include "main.hpp"
#include <SDL.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

const char* kDemoConfig = R"({
    "clock":  { "time_scale": 1.0, "max_delta": 0.25 },
    "random": { "channels": { "spawn": { "seed": 1337, "enabled": true },
                              "lighting": { "enabled": false } } },
    "tracks": [
        { "label": "quad in-out",    "shape": "QUAD_IN_OUT",    "loop": "RESET",          "duration": 1.5 },
        { "label": "bounce out",     "shape": "BOUNCE_OUT",     "loop": "PING_PONG",      "duration": 1.2 },
        { "label": "back in-out",    "shape": "BACK_IN_OUT",    "loop": "PING_PONG",      "duration": 2.0 },
        { "label": "elastic out",    "shape": "ELASTIC_OUT",    "loop": "PING_PONG_ONCE", "duration": 1.0 },
        { "label": "expo in",        "shape": "EXPO_IN",        "loop": "NO_LOOP",        "duration": 3.0 },
        { "label": "authored curve", "curve": [[0, 0], [0.3, 0.8], [0.6, 0.4], [1, 1]],
          "loop": "PING_PONG", "duration": 2.5, "scaled_time": false }
    ]
})";

constexpr int BAR_HEIGHT = 24;
constexpr int BAR_GAP    = 16;
constexpr int MARGIN     = 40;

}

MainApp::MainApp(SDL_Renderer* renderer, int screen_w, int screen_h)
: renderer_(renderer), screen_w_(screen_w), screen_h_(screen_h), random_(default_random_) {}

void MainApp::init() {
	setup();
	game_loop();
}

void MainApp::setup() {
        nlohmann::json config;
        try {
                config = nlohmann::json::parse(kDemoConfig);
        } catch (const nlohmann::json::parse_error& e) {
                std::cerr << "[MainApp] Demo config error: " << e.what() << "\n";
                throw;
        }

        const FrameClock::Config clock_cfg = FrameClock::config_from_json(config.value("clock", nlohmann::json::object()));
        clock_.set_time_scale(clock_cfg.time_scale);
        clock_.set_max_delta(clock_cfg.max_delta);

        random_.apply_config(config.value("random", nlohmann::json::object()));

        tracks_.clear();
        const auto tracks_it = config.find("tracks");
        if (tracks_it == config.end() || !tracks_it->is_array()) {
                std::cerr << "[MainApp] Demo config has no tracks\n";
                return;
        }
        for (const auto& entry : *tracks_it) {
                SDL_Color color{
                        static_cast<Uint8>(random_.get_range(RngChannel::Spawn, 80, 256)),
                        static_cast<Uint8>(random_.get_range(RngChannel::Spawn, 80, 256)),
                        static_cast<Uint8>(random_.get_range(RngChannel::Spawn, 80, 256)),
                        255
                };
                Easing easing = Easing::from_json(clock_, entry);
                const Easing::Loop loop = easing.loop();
                tracks_.push_back(Track{entry.value("label", std::string("track")),
                                        std::move(easing),
                                        loop,
                                        color});
        }
        std::cout << "[MainApp] Loaded " << tracks_.size() << " easing tracks\n";
        restart_tracks();
}

void MainApp::restart_tracks() {
        for (auto& track : tracks_) {
                // Ping-pong once drops to no loop after its turn; replay it as configured.
                track.easing.reset();
                track.easing.set_loop(track.loop);
                track.easing.begin();
                track.easing.set_paused(paused_);
        }
}

void MainApp::handle_key(SDL_Keycode key, bool& quit) {
        switch (key) {
                case SDLK_ESCAPE:
                        quit = true;
                        break;
                case SDLK_SPACE:
                        paused_ = !paused_;
                        for (auto& track : tracks_) track.easing.set_paused(paused_);
                        std::cout << "[MainApp] " << (paused_ ? "Paused" : "Resumed") << "\n";
                        break;
                case SDLK_r:
                        restart_tracks();
                        break;
                default:
                        break;
        }
}

void MainApp::render_tracks() {
        SDL_SetRenderDrawColor(renderer_, 12, 12, 16, 255);
        SDL_RenderClear(renderer_);

        const int full_w = std::max(1, screen_w_ - MARGIN * 2);
        int y = MARGIN;
        for (auto& track : tracks_) {
                const float v = track.easing.sample();

                SDL_Rect frame{MARGIN, y, full_w, BAR_HEIGHT};
                SDL_SetRenderDrawColor(renderer_, 60, 60, 70, 255);
                SDL_RenderDrawRect(renderer_, &frame);

                // Overshooting shapes may leave [0, 1]; clip to the window.
                const int w = std::clamp(static_cast<int>(v * full_w), -MARGIN, full_w + MARGIN);
                SDL_Rect bar{w >= 0 ? MARGIN : MARGIN + w, y + 3, std::abs(w), BAR_HEIGHT - 6};
                SDL_SetRenderDrawColor(renderer_, track.color.r, track.color.g, track.color.b, 255);
                SDL_RenderFillRect(renderer_, &bar);

                y += BAR_HEIGHT + BAR_GAP;
        }
        SDL_RenderPresent(renderer_);
}

void MainApp::game_loop() {
        constexpr int FRAME_MS = 1000 / 60;
        bool quit = false;
        SDL_Event e;
	while (!quit) {
		Uint32 start = SDL_GetTicks();
		while (SDL_PollEvent(&e)) {
			if (e.type == SDL_QUIT) quit = true;
			if (e.type == SDL_KEYDOWN && e.key.repeat == 0) handle_key(e.key.keysym.sym, quit);
		}
		clock_.tick();
		render_tracks();
		Uint32 elapsed = SDL_GetTicks() - start;
        if (elapsed < FRAME_MS) SDL_Delay(FRAME_MS - elapsed);
        }
}

void run(SDL_Window* window, SDL_Renderer* renderer, int screen_w, int screen_h) {
    (void)window;
    MainApp app(renderer, screen_w, screen_h);
    app.init();
}

int main(int argc, char* argv[]) {
	(void)argc; (void)argv;
	std::cout << "[Main] Starting easing demo...\n";
        if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) < 0) {
                std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n"; return 1;
        }
	SDL_Window* window = SDL_CreateWindow("Easing Demo", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 960, 540, 0);
	if (!window) {
		std::cerr << "SDL_CreateWindow failed: " << SDL_GetError() << "\n";
		SDL_Quit(); return 1;
	}
	SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED);
	if (!renderer) {
		std::cerr << "SDL_CreateRenderer failed: " << SDL_GetError() << "\n";
		SDL_DestroyWindow(window); SDL_Quit(); return 1;
	}
	SDL_RendererInfo info; SDL_GetRendererInfo(renderer, &info);
	std::cout << "[Main] Renderer: " << (info.name ? info.name : "Unknown") << "\n";
	int screen_width = 0, screen_height = 0;
	SDL_GetRendererOutputSize(renderer, &screen_width, &screen_height);
	std::cout << "[Main] Screen resolution: " << screen_width << "x" << screen_height << "\n";
	try {
		run(window, renderer, screen_width, screen_height);
	} catch (const std::exception& e) {
		std::cerr << "[Main] Fatal: " << e.what() << "\n";
		SDL_DestroyRenderer(renderer); SDL_DestroyWindow(window); SDL_Quit();
		return 1;
	}
	SDL_DestroyRenderer(renderer);
	SDL_DestroyWindow(window);
	SDL_Quit();
	std::cout << "[Main] Demo exited cleanly.\n";
	return 0;
}
