#include "render/sprite_view.hpp"

#include <string>

#include "sprite/sprite_player.hpp"
#include "ui/styles.hpp"
#include "utils/log.hpp"

using flipbook::sprite::SpritePlayer;

SpriteView::SpriteView(SDL_Renderer* renderer)
: renderer_(renderer) {}

void SpriteView::sync(const SpritePlayer& player) {
    if (player.sheet_revision() == revision_) {
        return;
    }
    revision_ = player.sheet_revision();
    texture_.reset();

    const auto* sheet = player.sheet();
    if (!sheet || !sheet->surface || !renderer_) {
        return;
    }
    SDL_Texture* tex = SDL_CreateTextureFromSurface(renderer_, sheet->surface.get());
    if (!tex) {
        flipbook::log::error(std::string("[SpriteView] SDL_CreateTextureFromSurface failed: ") + SDL_GetError());
        return;
    }
    // Pixel art stays crisp when scaled up.
    if (SDL_SetTextureScaleMode(tex, SDL_ScaleModeNearest) != 0) {
        flipbook::log::debug(std::string("[SpriteView] nearest scaling unavailable: ") + SDL_GetError());
    }
    texture_.reset(tex);
}

void SpriteView::render(const SpritePlayer& player, const SDL_Rect& panel, double max_preview_size) const {
    const SDL_Color& bg = Styles::Preview();
    SDL_SetRenderDrawColor(renderer_, bg.r, bg.g, bg.b, bg.a);
    SDL_RenderFillRect(renderer_, &panel);

    if (!texture_ || !player.geometry().resolved()) {
        return;
    }

    // Destination follows the integral source so uneven frames keep their pixel aspect.
    const flipbook::sprite::PixelRect px = flipbook::sprite::to_pixel_rect(player.source_rect());
    const double scale = player.preview_scale(max_preview_size);
    const float draw_w = static_cast<float>(px.w * scale);
    const float draw_h = static_cast<float>(px.h * scale);

    SDL_Rect src_px{ px.x, px.y, px.w, px.h };
    SDL_FRect dst{
        static_cast<float>(panel.x) + (static_cast<float>(panel.w) - draw_w) * 0.5f,
        static_cast<float>(panel.y) + (static_cast<float>(panel.h) - draw_h) * 0.5f,
        draw_w,
        draw_h,
    };
    if (SDL_RenderCopyF(renderer_, texture_.get(), &src_px, &dst) != 0) {
        flipbook::log::debug(std::string("[SpriteView] SDL_RenderCopyF failed: ") + SDL_GetError());
    }
}
