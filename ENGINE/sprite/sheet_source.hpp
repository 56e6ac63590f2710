#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include <SDL.h>

#include "sprite/frame_geometry.hpp"
#include "sprite/image_handle.hpp"

namespace flipbook::sprite {

struct LoadedSheet {
    std::string handle;
    SheetDimensions dimensions{};
    // Decoded pixels; may be null for sources that only report the natural size.
    std::shared_ptr<SDL_Surface> surface;
    // Encoded file bytes as received, used when the sheet is saved to disk.
    std::vector<std::uint8_t> encoded;
};

// Turns an image handle into a decoded sheet. The future either yields the sheet or rethrows
// ImageLoadError from get().
class SheetSource {
public:
    virtual ~SheetSource() = default;
    virtual std::future<LoadedSheet> load(const std::string& handle) = 0;
};

// Decodes with SDL_image on a worker thread.
class SdlImageSheetSource : public SheetSource {
public:
    std::future<LoadedSheet> load(const std::string& handle) override;

    // Synchronous decode, shared by the worker.
    static LoadedSheet decode(const std::string& handle);
};

// One load attempt observed from the main thread: Pending, then exactly one of Loaded or Failed.
class PendingSheet {
public:
    enum class State {
        Pending,
        Loaded,
        Failed,
    };

    PendingSheet(std::string handle, std::future<LoadedSheet> future);

    // Non-blocking.
    State poll();
    State state() const { return state_; }

    const std::string& handle() const { return handle_; }
    const std::string& error() const { return error_; }

    // Moves the decoded sheet out once Loaded.
    LoadedSheet take_sheet();

    // Hands the still-running future to the caller when this attempt is superseded.
    std::future<LoadedSheet> release();

private:
    std::string handle_;
    std::future<LoadedSheet> future_;
    State state_ = State::Pending;
    LoadedSheet sheet_{};
    std::string error_;
};

}
