#pragma once

#include <SDL.h>
#include <string>

struct LabelStyle {
	std::string font_path;
	int         font_size;
	SDL_Color   color;
};

class Styles {

	public:
    static const SDL_Color& Background();
    static const SDL_Color& Preview();
    static const SDL_Color& Border();
    static const SDL_Color& Primary();
    static const SDL_Color& PrimaryHover();
    static const SDL_Color& Knob();
    static const LabelStyle& LabelTitle();
    static const LabelStyle& LabelMain();
    static const LabelStyle& LabelSecondary();
    static const LabelStyle& LabelError();
};
