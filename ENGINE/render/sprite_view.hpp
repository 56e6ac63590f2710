#pragma once

#include <SDL.h>

#include <cstdint>
#include <memory>

namespace flipbook::sprite {
class SpritePlayer;
}

// Display surface for a SpritePlayer: clips the current frame out of the sheet texture using
// the player's frame geometry and draws it scaled and centred inside a panel.
class SpriteView {
public:
    explicit SpriteView(SDL_Renderer* renderer);

    // Recreates the texture when the player installed a new sheet.
    void sync(const flipbook::sprite::SpritePlayer& player);

    // Draws nothing but the panel until the player has resolved geometry.
    void render(const flipbook::sprite::SpritePlayer& player, const SDL_Rect& panel, double max_preview_size) const;

private:
    struct TextureDestroyer {
        void operator()(SDL_Texture* tex) const { if (tex) SDL_DestroyTexture(tex); }
    };

    SDL_Renderer* renderer_ = nullptr;
    std::unique_ptr<SDL_Texture, TextureDestroyer> texture_;
    std::uint64_t revision_ = 0;
};
