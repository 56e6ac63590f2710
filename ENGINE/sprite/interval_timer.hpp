#pragma once

#include <cstdint>
#include <functional>

namespace flipbook::sprite {

// Millisecond wall clock. The application uses SDL_GetTicks64; tests drive a manual clock.
using TickSource = std::function<std::uint64_t()>;

std::uint64_t sdl_ticks_ms();

// Fixed-period timer polled from the owner's update loop. Counts whole periods since it was
// armed; destroying it is the cancellation.
class IntervalTimer {
public:
    IntervalTimer(std::uint64_t armed_at_ms, double period_ms);

    // Number of periods that became due since the previous poll.
    std::uint64_t poll(std::uint64_t now_ms);

private:
    std::uint64_t armed_at_ms_ = 0;
    double period_ms_ = 0.0;
    std::uint64_t fired_ = 0;
};

}
