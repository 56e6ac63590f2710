#pragma once

#include <SDL.h>
#include <SDL_ttf.h>

#include <map>
#include <memory>
#include <string>
#include <utility>

#include "styles.hpp"

// Draws single lines of text with SDL_ttf. Fonts are opened on first use and kept per
// (path, size) until the renderer is destroyed. Must be used on the thread owning the SDL_Renderer.
class TextRenderer {
public:
    explicit TextRenderer(SDL_Renderer* renderer);
    ~TextRenderer();

    TextRenderer(const TextRenderer&) = delete;
    TextRenderer& operator=(const TextRenderer&) = delete;

    // Returns the drawn size; {0, 0} when the font or the text could not be rendered.
    SDL_Point draw(const std::string& text, const LabelStyle& style, int x, int y);
    SDL_Point draw(const std::string& text, const LabelStyle& style, int x, int y, SDL_Color color);
    SDL_Point draw_centered(const std::string& text, const LabelStyle& style, int center_x, int y);

    SDL_Point measure(const std::string& text, const LabelStyle& style);

private:
    struct FontCloser {
        void operator()(TTF_Font* font) const { if (font) TTF_CloseFont(font); }
    };
    using FontPtr = std::unique_ptr<TTF_Font, FontCloser>;

    TTF_Font* font_for(const LabelStyle& style);

    SDL_Renderer* renderer_ = nullptr;
    std::map<std::pair<std::string, int>, FontPtr> fonts_;
    bool warned_missing_font_ = false;
};
