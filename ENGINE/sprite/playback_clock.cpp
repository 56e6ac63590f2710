#include "sprite/playback_clock.hpp"

#include <utility>

namespace flipbook::sprite {

PlaybackClock::PlaybackClock(TickSource ticks, double fps)
    : ticks_(ticks ? std::move(ticks) : TickSource(&sdl_ticks_ms)),
      fps_(fps)
{
}

void PlaybackClock::play() {
    if (running_) return;
    running_ = true;
    rearm();
}

void PlaybackClock::pause() {
    running_ = false;
    timer_.reset();
}

void PlaybackClock::toggle() {
    if (running_) {
        pause();
    } else {
        play();
    }
}

void PlaybackClock::reset() {
    running_ = false;
    timer_.reset();
    current_frame_ = 0;
}

void PlaybackClock::set_fps(double fps) {
    fps_ = fps;
    if (running_) {
        rearm();
    }
}

void PlaybackClock::set_layout(const GridShape& grid, int frame_count, const FrameGeometry& geometry) {
    grid_ = grid;
    frame_count_ = frame_count;
    geometry_ = geometry;
    current_frame_ = 0;
    rearm();
}

void PlaybackClock::clear_layout() {
    grid_ = GridShape{};
    frame_count_ = 0;
    geometry_ = FrameGeometry{};
    current_frame_ = 0;
    timer_.reset();
}

double PlaybackClock::tick_period_ms() const {
    if (fps_ <= 0.0) return 0.0;
    return 1000.0 / fps_;
}

bool PlaybackClock::can_tick() const {
    return frame_count_ > 0 && fps_ > 0.0 && geometry_.resolved();
}

bool PlaybackClock::update() {
    if (!running_ || !timer_) {
        return false;
    }
    const std::uint64_t due = timer_->poll(ticks_());
    if (due == 0) {
        return false;
    }
    const auto count = static_cast<std::uint64_t>(frame_count_);
    const auto next = (static_cast<std::uint64_t>(current_frame_) + due % count) % count;
    const bool changed = static_cast<int>(next) != current_frame_;
    current_frame_ = static_cast<int>(next);
    return changed;
}

FrameOffset PlaybackClock::offset() const {
    return frame_offset(current_frame_, grid_.columns, geometry_);
}

FrameRect PlaybackClock::source_rect() const {
    return frame_source_rect(current_frame_, grid_.columns, geometry_);
}

void PlaybackClock::rearm() {
    if (running_ && can_tick()) {
        timer_.emplace(ticks_(), tick_period_ms());
    } else {
        timer_.reset();
    }
}

}
