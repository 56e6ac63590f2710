#pragma once

#include <SDL.h>
#include <string>

class TextRenderer;

// Horizontal integer slider with a caption above the track, e.g. "FPS: 12".
class Slider {
public:
    Slider(const std::string& label, int min_val, int max_val, int current_val);
    void set_rect(const SDL_Rect& r);
    const SDL_Rect& rect() const;
    int  value() const;
    // True when the value changed.
    bool handle_event(const SDL_Event& e);
    void render(SDL_Renderer* renderer, TextRenderer& text) const;
    static int height();

private:
    SDL_Rect track_rect() const;
    SDL_Rect knob_rect_for_value(int v) const;
    int      value_for_x(int mouse_x) const;

private:
    SDL_Rect rect_{0,0,240,40};
    std::string label_;
    int min_ = 0;
    int max_ = 100;
    int value_ = 0;
    bool dragging_ = false;
    bool knob_hovered_ = false;
};
