#pragma once

#include <cstdint>

namespace flipbook::sprite {

class SpritePlayer;

// Reports the outcome of a load the caller asked for exactly once, including loads that
// complete inside SpritePlayer::load().
class LoadObserver {
public:
    enum class Event {
        None,
        Arrived,
        Failed,
    };

    // Call before SpritePlayer::load(); remembers the revision on screen.
    void expect(const SpritePlayer& player);
    void cancel() { awaiting_ = false; }

    Event observe(const SpritePlayer& player);

private:
    bool awaiting_ = false;
    std::uint64_t seen_revision_ = 0;
};

}
