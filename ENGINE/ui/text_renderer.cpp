#include "text_renderer.hpp"

#include "utils/log.hpp"

TextRenderer::TextRenderer(SDL_Renderer* renderer)
: renderer_(renderer) {}

TextRenderer::~TextRenderer() = default;

TTF_Font* TextRenderer::font_for(const LabelStyle& style) {
    auto key = std::make_pair(style.font_path, style.font_size);
    auto it = fonts_.find(key);
    if (it != fonts_.end()) {
        return it->second.get();
    }
    FontPtr font(TTF_OpenFont(style.font_path.c_str(), style.font_size));
    if (!font && !warned_missing_font_) {
        warned_missing_font_ = true;
        flipbook::log::warn("[Text] TTF_OpenFont failed for '" + style.font_path + "': " + TTF_GetError());
    }
    TTF_Font* raw = font.get();
    fonts_.emplace(std::move(key), std::move(font));
    return raw;
}

SDL_Point TextRenderer::draw(const std::string& text, const LabelStyle& style, int x, int y) {
    return draw(text, style, x, y, style.color);
}

SDL_Point TextRenderer::draw(const std::string& text, const LabelStyle& style, int x, int y, SDL_Color color) {
    if (text.empty() || !renderer_) return SDL_Point{0, 0};
    TTF_Font* font = font_for(style);
    if (!font) return SDL_Point{0, 0};

    SDL_Surface* surf = TTF_RenderUTF8_Blended(font, text.c_str(), color);
    if (!surf) return SDL_Point{0, 0};
    SDL_Point size{ surf->w, surf->h };
    if (SDL_Texture* tex = SDL_CreateTextureFromSurface(renderer_, surf)) {
        SDL_Rect dst{ x, y, surf->w, surf->h };
        SDL_RenderCopy(renderer_, tex, nullptr, &dst);
        SDL_DestroyTexture(tex);
    }
    SDL_FreeSurface(surf);
    return size;
}

SDL_Point TextRenderer::draw_centered(const std::string& text, const LabelStyle& style, int center_x, int y) {
    const SDL_Point size = measure(text, style);
    return draw(text, style, center_x - size.x / 2, y);
}

SDL_Point TextRenderer::measure(const std::string& text, const LabelStyle& style) {
    SDL_Point size{0, 0};
    if (text.empty()) return size;
    if (TTF_Font* font = font_for(style)) {
        if (TTF_SizeUTF8(font, text.c_str(), &size.x, &size.y) != 0) {
            size = SDL_Point{0, 0};
        }
    }
    return size;
}
