#include "slider.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "styles.hpp"
#include "text_renderer.hpp"

namespace {
constexpr int kCaptionGap = 4;
}

Slider::Slider(const std::string& label, int min_val, int max_val, int current_val)
: label_(label), min_(std::min(min_val, max_val)), max_(std::max(min_val, max_val))
{
	value_ = std::max(min_, std::min(max_, current_val));
}

void Slider::set_rect(const SDL_Rect& r) { rect_ = r; }

const SDL_Rect& Slider::rect() const { return rect_; }

int Slider::value() const { return value_; }

int Slider::height() { return 40; }

SDL_Rect Slider::track_rect() const {
	const int pad = 8;
	const int track_h = 6;
	const int cy = rect_.y + rect_.h/2;
	SDL_Rect t{ rect_.x + pad, cy - track_h/2, rect_.w - 2*pad, track_h };
	if (t.w < 10) t.w = 10;
	return t;
}

SDL_Rect Slider::knob_rect_for_value(int v) const {
	const SDL_Rect tr = track_rect();
	const int knob_w = 12;
	const int knob_h = 20;
	const int range = std::max(1, max_ - min_);
	const float t = float(v - min_) / float(range);
	const int x = tr.x + int(std::round(t * (tr.w))) - knob_w/2;
	const int y = tr.y + tr.h/2 - knob_h/2;
	return SDL_Rect{ x, y, knob_w, knob_h };
}

int Slider::value_for_x(int mouse_x) const {
	const SDL_Rect tr = track_rect();
	const int clamped_x = std::max(tr.x, std::min(tr.x + tr.w, mouse_x));
	const int range = std::max(1, max_ - min_);
	const float t = float(clamped_x - tr.x) / float(tr.w);
	const int v = min_ + int(std::round(t * range));
	return std::max(min_, std::min(max_, v));
}

bool Slider::handle_event(const SDL_Event& e) {
	bool changed = false;
	const SDL_Rect krect = knob_rect_for_value(value_);
	if (e.type == SDL_MOUSEMOTION) {
		SDL_Point p{ e.motion.x, e.motion.y };
		knob_hovered_ = SDL_PointInRect(&p, &krect);
		if (dragging_) {
			const int new_val = value_for_x(e.motion.x);
			if (new_val != value_) { value_ = new_val; changed = true; }
		}
	}
	else if (e.type == SDL_MOUSEBUTTONDOWN && e.button.button == SDL_BUTTON_LEFT) {
		SDL_Point p{ e.button.x, e.button.y };
		if (SDL_PointInRect(&p, &krect) || SDL_PointInRect(&p, &rect_)) {
			dragging_ = true;
			const int new_val = value_for_x(e.button.x);
			if (new_val != value_) { value_ = new_val; changed = true; }
		}
	}
	else if (e.type == SDL_MOUSEBUTTONUP && e.button.button == SDL_BUTTON_LEFT) {
		dragging_ = false;
	}
	return changed;
}

static void fill_rect(SDL_Renderer* r, const SDL_Rect& rc, SDL_Color c) {
	SDL_SetRenderDrawColor(r, c.r, c.g, c.b, c.a);
	SDL_RenderFillRect(r, &rc);
}

void Slider::render(SDL_Renderer* renderer, TextRenderer& text) const {
	const LabelStyle& caption = Styles::LabelSecondary();
	const std::string caption_text = label_ + ": " + std::to_string(value_);
	const SDL_Point size = text.measure(caption_text, caption);
	text.draw(caption_text, caption, rect_.x, rect_.y - size.y - kCaptionGap);

	const SDL_Rect tr = track_rect();
	fill_rect(renderer, tr, Styles::Border());
	SDL_Rect tr_fill = tr;
	const int range = std::max(1, max_ - min_);
	const float t = float(value_ - min_) / float(range);
	tr_fill.w = std::max(0, int(std::round(t * tr.w)));
	fill_rect(renderer, tr_fill, knob_hovered_ || dragging_ ? Styles::PrimaryHover() : Styles::Primary());

	const SDL_Rect krect = knob_rect_for_value(value_);
	fill_rect(renderer, krect, Styles::Knob());
}
