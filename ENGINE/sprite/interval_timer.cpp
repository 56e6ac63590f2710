#include "sprite/interval_timer.hpp"

#include <cmath>

#include <SDL.h>

namespace flipbook::sprite {

std::uint64_t sdl_ticks_ms() {
    return static_cast<std::uint64_t>(SDL_GetTicks64());
}

IntervalTimer::IntervalTimer(std::uint64_t armed_at_ms, double period_ms)
    : armed_at_ms_(armed_at_ms), period_ms_(period_ms) {}

std::uint64_t IntervalTimer::poll(std::uint64_t now_ms) {
    if (period_ms_ <= 0.0 || now_ms <= armed_at_ms_) {
        return 0;
    }
    const double elapsed = static_cast<double>(now_ms - armed_at_ms_);
    // Periods such as 1000/12 are inexact; the epsilon keeps a tick on its exact boundary due.
    const auto due = static_cast<std::uint64_t>(std::floor(elapsed / period_ms_ + 1e-9));
    if (due <= fired_) {
        return 0;
    }
    const std::uint64_t fresh = due - fired_;
    fired_ = due;
    return fresh;
}

}
