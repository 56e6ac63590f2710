#include "styles.hpp"

#include "font_paths.hpp"

static inline SDL_Color make_color(Uint8 r, Uint8 g, Uint8 b, Uint8 a = 255) {
    return SDL_Color{ r, g, b, a };
}

static const SDL_Color kBackground   = make_color( 18, 18, 18,255);
static const SDL_Color kPreview      = make_color( 30, 30, 30,255);
static const SDL_Color kBorder       = make_color( 70, 70, 80,255);
static const SDL_Color kPrimary      = make_color(124, 58,237,255);
static const SDL_Color kPrimaryHover = make_color(139, 92,246,255);
static const SDL_Color kKnob         = make_color(240,240,245,255);
static const SDL_Color kOnSurface    = make_color(235,235,240,255);
static const SDL_Color kOnSurface2   = make_color(160,160,170,255);
static const SDL_Color kDanger       = make_color(248,113,113,255);

static const LabelStyle kLabelTitle{
    ui_fonts::sans_bold(), 28, kOnSurface };
static const LabelStyle kLabelMain{
    ui_fonts::sans_regular(), 18, kOnSurface };
static const LabelStyle kLabelSecondary{
    ui_fonts::sans_regular(), 15, kOnSurface2 };
static const LabelStyle kLabelError{
    ui_fonts::sans_regular(), 15, kDanger };

const SDL_Color& Styles::Background()         { return kBackground; }
const SDL_Color& Styles::Preview()            { return kPreview; }
const SDL_Color& Styles::Border()             { return kBorder; }
const SDL_Color& Styles::Primary()            { return kPrimary; }
const SDL_Color& Styles::PrimaryHover()       { return kPrimaryHover; }
const SDL_Color& Styles::Knob()               { return kKnob; }
const LabelStyle& Styles::LabelTitle()        { return kLabelTitle; }
const LabelStyle& Styles::LabelMain()         { return kLabelMain; }
const LabelStyle& Styles::LabelSecondary()    { return kLabelSecondary; }
const LabelStyle& Styles::LabelError()        { return kLabelError; }
