#pragma once

#include <SDL.h>
#include <memory>
#include <string>

#include "config/settings.hpp"
#include "sprite/load_observer.hpp"
#include "ui/slider.hpp"

namespace flipbook::sprite {
class SheetSource;
class SpritePlayer;
}

namespace flipbook::generation {
class GenerationService;
class GenerationJob;
}

class SpriteView;
class TextRenderer;

struct LaunchOptions {
    std::string sheet_path;
    std::string response_path;
    std::string prompt;
};

LaunchOptions parse_launch_options(int argc, char* argv[]);

class StudioApp {

        public:
    StudioApp(SDL_Renderer* renderer, int screen_w, int screen_h,
              flipbook::settings::Settings settings, LaunchOptions options);
    ~StudioApp();
    void init();
    void setup();
    void main_loop();

	private:
    void handle_event(const SDL_Event& e);
    void handle_key(const SDL_KeyboardEvent& key);
    void start_generation();
    void poll_generation();
    void load_sheet(const std::string& handle);
    void on_sheet_update();
    void download_sheet();
    void apply_grid();
    void layout();
    void render();
    void persist_settings();
    void set_status(const std::string& text, bool is_error);

    SDL_Renderer* renderer_ = nullptr;
    int           screen_w_ = 0;
    int           screen_h_ = 0;
    flipbook::settings::Settings settings_;
    LaunchOptions options_;

    std::shared_ptr<flipbook::sprite::SheetSource>         source_;
    std::unique_ptr<flipbook::sprite::SpritePlayer>        player_;
    std::shared_ptr<flipbook::generation::GenerationService> service_;
    std::unique_ptr<flipbook::generation::GenerationJob>   job_;
    std::unique_ptr<SpriteView>   view_;
    std::unique_ptr<TextRenderer> text_;

    Slider columns_slider_;
    Slider rows_slider_;
    Slider fps_slider_;
    SDL_Rect preview_rect_{0, 0, 0, 0};
    flipbook::sprite::LoadObserver sheet_observer_;

    std::string status_text_;
    bool        status_is_error_ = false;
    bool        play_when_loaded_ = false;
    bool        quit_ = false;
};

void run(SDL_Renderer* renderer, int screen_w, int screen_h, const LaunchOptions& options);
