#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sprite/frame_geometry.hpp"
#include "sprite/playback_clock.hpp"
#include "sprite/sheet_source.hpp"

namespace flipbook::sprite {

// One animated preview of a sprite sheet. Owns its load attempt, geometry and clock; nothing
// is shared between players.
class SpritePlayer {
public:
    enum class LoadState {
        Empty,
        Pending,
        Loaded,
        Failed,
    };

    SpritePlayer(std::shared_ptr<SheetSource> source, TickSource ticks = &sdl_ticks_ms);
    ~SpritePlayer();

    SpritePlayer(const SpritePlayer&) = delete;
    SpritePlayer& operator=(const SpritePlayer&) = delete;

    // Starts loading a new sheet. The previous sheet, geometry and timer are dropped at once,
    // so nothing ticks against them while the new image decodes.
    void load(const std::string& handle);

    // Drops the sheet, any pending load and the timer; the player shows nothing until the next load().
    void clear();

    // Observes the pending load. On success the geometry is resolved and the clock is reset to
    // Stopped at frame 0; true when a sheet arrived during this call.
    bool poll_load();

    // poll_load() followed by the clock; true when the visible frame or the sheet changed.
    bool update();

    // Re-resolves against the current sheet and rewinds to frame 0. Running state is kept.
    void set_grid(const GridShape& grid);

    void play() { clock_.play(); }
    void pause() { clock_.pause(); }
    void toggle() { clock_.toggle(); }
    void set_fps(double fps) { clock_.set_fps(fps); }

    LoadState load_state() const { return state_; }
    const std::string& load_error() const { return load_error_; }
    const std::string& handle() const { return handle_; }

    const GridShape& grid() const { return grid_; }
    int frame_count() const { return grid_.frame_count(); }

    // Changes every time a new sheet is installed or clear() drops one.
    std::uint64_t sheet_revision() const { return sheet_revision_; }
    const LoadedSheet* sheet() const { return sheet_ ? &*sheet_ : nullptr; }

    const PlaybackClock& clock() const { return clock_; }
    int current_frame() const { return clock_.current_frame(); }
    bool is_running() const { return clock_.is_running(); }
    const FrameGeometry& geometry() const { return clock_.geometry(); }
    FrameOffset offset() const { return clock_.offset(); }
    FrameRect source_rect() const { return clock_.source_rect(); }
    double preview_scale(double max_preview_size) const;

private:
    void retire_pending();
    void prune_retired();

    std::shared_ptr<SheetSource> source_;
    PlaybackClock clock_;
    GridShape grid_{4, 4};
    LoadState state_ = LoadState::Empty;
    std::string handle_;
    std::string load_error_;
    std::optional<PendingSheet> pending_;
    std::optional<LoadedSheet> sheet_;
    std::uint64_t sheet_revision_ = 0;
    std::vector<std::future<LoadedSheet>> retired_;
};

}
