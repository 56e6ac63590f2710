#pragma once

#include <cstdint>
#include <optional>

#include "sprite/frame_geometry.hpp"
#include "sprite/interval_timer.hpp"

namespace flipbook::sprite {

inline constexpr double kDefaultFps = 12.0;

// Owns the animation state of one sprite player: the current frame index, running/paused and
// the tick timer. Stopped freezes the index; Running advances it once per 1000/fps ms.
// No ticking happens until a frame count, a positive fps and a resolved geometry are present.
class PlaybackClock {
public:
    explicit PlaybackClock(TickSource ticks = &sdl_ticks_ms, double fps = kDefaultFps);

    // Resumes from the current index.
    void play();
    // Freezes the index and releases the timer.
    void pause();
    void toggle();
    // Stopped, index 0, timer released. Used whenever a new sheet arrives.
    void reset();

    // Restarts the timer at the new period while running; the index is kept.
    void set_fps(double fps);

    // Installs the layout of a freshly resolved sheet and rewinds to frame 0.
    void set_layout(const GridShape& grid, int frame_count, const FrameGeometry& geometry);
    void clear_layout();

    // Fires every tick that became due; true when the visible frame changed.
    bool update();

    int current_frame() const { return current_frame_; }
    bool is_running() const { return running_; }
    double fps() const { return fps_; }
    int frame_count() const { return frame_count_; }
    int columns() const { return grid_.columns; }
    const FrameGeometry& geometry() const { return geometry_; }

    // 0 when fps is not positive.
    double tick_period_ms() const;
    bool can_tick() const;
    bool timer_armed() const { return timer_.has_value(); }

    FrameOffset offset() const;
    FrameRect source_rect() const;

private:
    void rearm();

    TickSource ticks_;
    double fps_ = kDefaultFps;
    bool running_ = false;
    int current_frame_ = 0;
    int frame_count_ = 0;
    GridShape grid_{};
    FrameGeometry geometry_{};
    std::optional<IntervalTimer> timer_;
};

}
