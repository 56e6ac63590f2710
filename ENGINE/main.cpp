#include "main.hpp"

#include "generation/generation_request.hpp"
#include "generation/generation_service.hpp"
#include "render/sprite_view.hpp"
#include "sprite/aspect_ratio.hpp"
#include "sprite/sheet_source.hpp"
#include "sprite/sprite_player.hpp"
#include "ui/styles.hpp"
#include "ui/text_renderer.hpp"
#include "utils/log.hpp"
#include "utils/status_notifier.hpp"
#include "utils/string_utils.hpp"
#include <SDL.h>
#include <SDL_image.h>
#include <SDL_ttf.h>
#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

constexpr int kWindowWidth  = 720;
constexpr int kWindowHeight = 680;
constexpr int kMargin       = 32;
constexpr int kSliderGap    = 24;

using flipbook::generation::GenerationJob;
using flipbook::sprite::LoadObserver;
using flipbook::sprite::SpritePlayer;

}

LaunchOptions parse_launch_options(int argc, char* argv[]) {
        LaunchOptions options;
        std::string prompt;
        for (int i = 1; i < argc; ++i) {
                const std::string arg = argv[i] ? argv[i] : "";
                if ((arg == "--sheet" || arg == "--response") && i + 1 < argc && argv[i + 1]) {
                        (arg == "--sheet" ? options.sheet_path : options.response_path) = argv[++i];
                        continue;
                }
                if (!prompt.empty()) prompt += ' ';
                prompt += arg;
        }
        options.prompt = flipbook::strings::trim_copy(prompt);
        return options;
}

StudioApp::StudioApp(SDL_Renderer* renderer,
                     int screen_w,
                     int screen_h,
                     flipbook::settings::Settings settings,
                     LaunchOptions options)
: renderer_(renderer),
  screen_w_(screen_w),
  screen_h_(screen_h),
  settings_(std::move(settings)),
  options_(std::move(options)),
  columns_slider_("Columns", flipbook::settings::kMinGridSize, flipbook::settings::kMaxGridSize, settings_.columns),
  rows_slider_("Rows", flipbook::settings::kMinGridSize, flipbook::settings::kMaxGridSize, settings_.rows),
  fps_slider_("FPS", flipbook::settings::kMinFps, flipbook::settings::kMaxFps, settings_.fps) {}

StudioApp::~StudioApp() {
        job_.reset();
        player_.reset();
        if (SDL_IsTextInputActive()) {
                SDL_StopTextInput();
        }
}

void StudioApp::init() {
        setup();
        flipbook::log::info("[StudioApp] Setup complete. Entering main loop...");
        main_loop();
        persist_settings();
}

void StudioApp::setup() {
        if (!options_.prompt.empty()) {
                settings_.prompt = options_.prompt;
        }
        if (!options_.response_path.empty()) {
                settings_.response_path = options_.response_path;
        }

        source_ = std::make_shared<flipbook::sprite::SdlImageSheetSource>();
        player_ = std::make_unique<SpritePlayer>(source_);
        player_->set_grid(settings_.grid());
        player_->set_fps(static_cast<double>(settings_.fps));

        if (!settings_.response_path.empty()) {
                service_ = std::make_shared<flipbook::generation::ResponseFileService>(settings_.response_path);
                flipbook::log::info("[StudioApp] Generation backend: replaying " + settings_.response_path);
        } else {
                flipbook::log::warn("[StudioApp] No generation backend configured; set response_path or pass --response.");
        }

        view_ = std::make_unique<SpriteView>(renderer_);
        text_ = std::make_unique<TextRenderer>(renderer_);
        layout();

        if (!options_.sheet_path.empty()) {
                play_when_loaded_ = settings_.playing;
                load_sheet(options_.sheet_path);
        } else {
                set_status("Ready to Create", false);
        }
        SDL_StartTextInput();
}

void StudioApp::main_loop() {
        constexpr double TARGET_FPS = 120.0;
        const double perf_frequency = static_cast<double>(SDL_GetPerformanceFrequency());
        const double target_counts  = perf_frequency / TARGET_FPS;

        flipbook::status::ScopedNotifier notifier(
                [this](flipbook::status::Kind kind, const std::string& message) {
                        set_status(message, kind == flipbook::status::Kind::Failure);
                });

        SDL_Event e;
        while (!quit_) {
                const Uint64 frame_begin = SDL_GetPerformanceCounter();

                while (SDL_PollEvent(&e)) {
                        handle_event(e);
                }

                poll_generation();
                on_sheet_update();
                render();

                const double work_counts = static_cast<double>(SDL_GetPerformanceCounter() - frame_begin);
                if (work_counts < target_counts) {
                        const double remaining_ms = ((target_counts - work_counts) * 1000.0) / perf_frequency;
                        if (remaining_ms >= 1.0) {
                                SDL_Delay(static_cast<Uint32>(remaining_ms));
                        }
                }
        }
        flipbook::log::info("[StudioApp] Main loop finished.");
}

void StudioApp::handle_event(const SDL_Event& e) {
        switch (e.type) {
        case SDL_QUIT:
                quit_ = true;
                return;
        case SDL_KEYDOWN:
                handle_key(e.key);
                return;
        case SDL_TEXTINPUT:
                if (!job_) {
                        settings_.prompt += e.text.text;
                }
                return;
        default:
                break;
        }

        if (columns_slider_.handle_event(e) | rows_slider_.handle_event(e)) {
                apply_grid();
        }
        if (fps_slider_.handle_event(e)) {
                settings_.fps = fps_slider_.value();
                player_->set_fps(static_cast<double>(settings_.fps));
        }
}

void StudioApp::handle_key(const SDL_KeyboardEvent& key) {
        const bool ctrl = (key.keysym.mod & KMOD_CTRL) != 0;
        switch (key.keysym.sym) {
        case SDLK_ESCAPE:
                quit_ = true;
                break;
        case SDLK_RETURN:
        case SDLK_KP_ENTER:
                start_generation();
                break;
        case SDLK_TAB:
                player_->toggle();
                settings_.playing = player_->is_running();
                flipbook::log::debug(std::string("[StudioApp] ") + (settings_.playing ? "Play" : "Pause"));
                break;
        case SDLK_BACKSPACE:
                if (!job_ && !settings_.prompt.empty()) {
                        // Drop a whole UTF-8 sequence.
                        std::size_t cut = settings_.prompt.size() - 1;
                        while (cut > 0 && (static_cast<unsigned char>(settings_.prompt[cut]) & 0xC0) == 0x80) {
                                --cut;
                        }
                        settings_.prompt.erase(cut);
                }
                break;
        case SDLK_s:
                if (ctrl) download_sheet();
                break;
        default:
                break;
        }
}

void StudioApp::start_generation() {
        if (job_) {
                return;
        }
        if (flipbook::strings::is_blank(settings_.prompt)) {
                set_status("Describe the sprite before generating.", false);
                return;
        }

        flipbook::generation::GenerationRequest request =
                flipbook::generation::compose_request(settings_.prompt, settings_.grid(),
                                                      settings_.model, settings_.output_mime_type);
        flipbook::log::info("[StudioApp] Requesting " + std::to_string(request.frame_count) + " frames at " +
                            std::string(flipbook::sprite::label(request.aspect_ratio)));

        // The previous sheet no longer matches the prompt being generated.
        sheet_observer_.cancel();
        play_when_loaded_ = false;
        player_->clear();
        view_->sync(*player_);

        job_ = std::make_unique<GenerationJob>(service_, std::move(request));
        flipbook::status::progress("Generating your sprite sheet... This can take a moment.");
}

void StudioApp::poll_generation() {
        if (!job_) {
                return;
        }
        switch (job_->poll()) {
        case GenerationJob::State::Running:
                return;
        case GenerationJob::State::Failed:
                flipbook::status::failure("Generation Failed: " + job_->error());
                break;
        case GenerationJob::State::Succeeded:
                play_when_loaded_ = true;
                load_sheet(job_->image_handle());
                break;
        }
        job_.reset();
}

void StudioApp::load_sheet(const std::string& handle) {
        flipbook::status::progress("Loading sprite sheet...");
        sheet_observer_.expect(*player_);
        player_->load(handle);
}

void StudioApp::on_sheet_update() {
        player_->update();
        view_->sync(*player_);

        switch (sheet_observer_.observe(*player_)) {
        case LoadObserver::Event::None:
                break;
        case LoadObserver::Event::Arrived:
                if (play_when_loaded_) {
                        player_->play();
                        settings_.playing = true;
                        play_when_loaded_ = false;
                }
                flipbook::status::ready("Total Frames: " + std::to_string(player_->frame_count()));
                break;
        case LoadObserver::Event::Failed:
                play_when_loaded_ = false;
                flipbook::status::failure("Failed to load the sprite sheet image. (" + player_->load_error() + ")");
                break;
        }
}

void StudioApp::download_sheet() {
        const auto* sheet = player_->sheet();
        if (!sheet || sheet->encoded.empty()) {
                set_status("Nothing to download yet.", false);
                return;
        }
        const std::filesystem::path target(settings_.download_path);
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
                flipbook::status::failure("Unable to write " + target.string());
                return;
        }
        out.write(reinterpret_cast<const char*>(sheet->encoded.data()),
                  static_cast<std::streamsize>(sheet->encoded.size()));
        if (!out.good()) {
                flipbook::status::failure("Failed while writing " + target.string());
                return;
        }
        flipbook::status::ready("Saved " + target.string());
}

void StudioApp::apply_grid() {
        settings_.columns = flipbook::settings::clamp_grid_size(columns_slider_.value());
        settings_.rows = flipbook::settings::clamp_grid_size(rows_slider_.value());
        player_->set_grid(settings_.grid());
}

void StudioApp::layout() {
        const int content_w = screen_w_ - 2 * kMargin;
        const int half_w = (content_w - kSliderGap) / 2;
        const int grid_y = kMargin + 120;
        columns_slider_.set_rect(SDL_Rect{ kMargin, grid_y, half_w, Slider::height() });
        rows_slider_.set_rect(SDL_Rect{ kMargin + half_w + kSliderGap, grid_y, half_w, Slider::height() });

        const int preview_size = std::max(settings_.preview_max_size, 64);
        preview_rect_ = SDL_Rect{ (screen_w_ - preview_size - 64) / 2, grid_y + 80, preview_size + 64, preview_size + 64 };

        const int fps_y = preview_rect_.y + preview_rect_.h + 48;
        fps_slider_.set_rect(SDL_Rect{ kMargin, fps_y, content_w, Slider::height() });
}

void StudioApp::render() {
        const SDL_Color& bg = Styles::Background();
        SDL_SetRenderDrawColor(renderer_, bg.r, bg.g, bg.b, bg.a);
        SDL_RenderClear(renderer_);

        text_->draw("Flipbook Sprite Sheet Generator", Styles::LabelTitle(), kMargin, kMargin);
        const std::string prompt_line = settings_.prompt.empty()
                ? std::string("Type a description, e.g. A pixel art knight walking to the right")
                : settings_.prompt;
        text_->draw(prompt_line, settings_.prompt.empty() ? Styles::LabelSecondary() : Styles::LabelMain(),
                    kMargin, kMargin + 48);

        columns_slider_.render(renderer_, *text_);
        rows_slider_.render(renderer_, *text_);
        text_->draw_centered("Total Frames: " + std::to_string(settings_.frame_count()) + "  (" +
                             std::string(flipbook::sprite::label(
                                     flipbook::sprite::classify(settings_.columns, settings_.rows))) + ")",
                             Styles::LabelSecondary(), screen_w_ / 2, columns_slider_.rect().y + 46);

        view_->render(*player_, preview_rect_, static_cast<double>(settings_.preview_max_size));

        const LabelStyle& status_style = status_is_error_ ? Styles::LabelError() : Styles::LabelMain();
        text_->draw_centered(status_text_, status_style, screen_w_ / 2, preview_rect_.y + preview_rect_.h + 8);

        fps_slider_.render(renderer_, *text_);
        const std::string hints = std::string("Enter: generate   Tab: ") +
                                  (player_->is_running() ? "pause" : "play") +
                                  "   Ctrl+S: download   Esc: quit";
        text_->draw_centered(hints, Styles::LabelSecondary(), screen_w_ / 2, screen_h_ - kMargin);

        SDL_RenderPresent(renderer_);
}

void StudioApp::persist_settings() {
        try {
                flipbook::settings::save_settings(settings_);
        } catch (const std::exception& ex) {
                flipbook::log::error(std::string("[StudioApp] Unable to save settings: ") + ex.what());
        }
}

void StudioApp::set_status(const std::string& text, bool is_error) {
        status_text_ = text;
        status_is_error_ = is_error;
}

void run(SDL_Renderer* renderer, int screen_w, int screen_h, const LaunchOptions& options) {
        flipbook::settings::Settings settings = flipbook::settings::load_settings();
        StudioApp app(renderer, screen_w, screen_h, std::move(settings), options);
        app.init();
}

int main(int argc, char* argv[]) {
        flipbook::log::info("[Main] Starting flipbook...");
        const LaunchOptions options = parse_launch_options(argc, argv);

        if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) < 0) {
                flipbook::log::error(std::string("SDL_Init failed: ") + SDL_GetError());
                return 1;
        }

        if (TTF_Init() < 0) {
                flipbook::log::error(std::string("TTF_Init failed: ") + TTF_GetError());
                SDL_Quit();
                return 1;
        }

        const int image_flags = IMG_INIT_PNG | IMG_INIT_JPG | IMG_INIT_WEBP;
        if (!(IMG_Init(image_flags) & IMG_INIT_PNG)) {
                flipbook::log::error(std::string("IMG_Init failed: ") + IMG_GetError());
                TTF_Quit();
                SDL_Quit();
                return 1;
        }

        SDL_Window* window = SDL_CreateWindow("flipbook", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                              kWindowWidth, kWindowHeight, SDL_WINDOW_ALLOW_HIGHDPI);
        if (!window) {
                flipbook::log::error(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
                IMG_Quit();
                TTF_Quit();
                SDL_Quit();
                return 1;
        }

        SDL_Renderer* renderer =
                SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
        if (!renderer) {
                flipbook::log::error(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
                SDL_DestroyWindow(window);
                IMG_Quit();
                TTF_Quit();
                SDL_Quit();
                return 1;
        }

        SDL_RendererInfo info;
        if (SDL_GetRendererInfo(renderer, &info) == 0) {
                flipbook::log::info(std::string("[Main] Renderer: ") + (info.name ? info.name : "Unknown"));
        }
        if (SDL_RenderSetLogicalSize(renderer, kWindowWidth, kWindowHeight) != 0) {
                flipbook::log::warn(std::string("[Main] SDL_RenderSetLogicalSize failed: ") + SDL_GetError());
        }

        int exit_code = 0;
        try {
                run(renderer, kWindowWidth, kWindowHeight, options);
        } catch (const std::exception& ex) {
                flipbook::log::error(std::string("[Main] Aborting: ") + ex.what());
                exit_code = 1;
        }

        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        IMG_Quit();
        TTF_Quit();
        SDL_Quit();
        if (exit_code == 0) {
                flipbook::log::info("[Main] Exited cleanly.");
        }
        return exit_code;
}
