#include "sprite/sheet_source.hpp"

#include <chrono>
#include <utility>

#include <SDL_image.h>

namespace flipbook::sprite {

LoadedSheet SdlImageSheetSource::decode(const std::string& handle) {
    LoadedSheet sheet;
    sheet.handle = handle;
    sheet.encoded = read_image_bytes(handle);

    SDL_RWops* rw = SDL_RWFromConstMem(sheet.encoded.data(), static_cast<int>(sheet.encoded.size()));
    if (!rw) {
        throw ImageLoadError(std::string("SDL_RWFromConstMem failed: ") + SDL_GetError());
    }
    SDL_Surface* surface = IMG_Load_RW(rw, 1);
    if (!surface) {
        throw ImageLoadError(std::string("IMG_Load_RW failed: ") + IMG_GetError());
    }
    sheet.surface = std::shared_ptr<SDL_Surface>(surface, SDL_FreeSurface);
    sheet.dimensions = SheetDimensions{ surface->w, surface->h };
    if (sheet.dimensions.width <= 0 || sheet.dimensions.height <= 0) {
        throw ImageLoadError("decoded image has no pixels");
    }
    return sheet;
}

std::future<LoadedSheet> SdlImageSheetSource::load(const std::string& handle) {
    return std::async(std::launch::async, [handle]() { return decode(handle); });
}

PendingSheet::PendingSheet(std::string handle, std::future<LoadedSheet> future)
    : handle_(std::move(handle)), future_(std::move(future)) {
    if (!future_.valid()) {
        state_ = State::Failed;
        error_ = "image source returned no result";
    }
}

PendingSheet::State PendingSheet::poll() {
    if (state_ != State::Pending) {
        return state_;
    }
    if (future_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return state_;
    }
    try {
        sheet_ = future_.get();
        state_ = State::Loaded;
    } catch (const ImageLoadError& ex) {
        error_ = ex.what();
        state_ = State::Failed;
    } catch (const std::exception& ex) {
        error_ = std::string("unexpected failure: ") + ex.what();
        state_ = State::Failed;
    }
    return state_;
}

LoadedSheet PendingSheet::take_sheet() {
    return std::move(sheet_);
}

std::future<LoadedSheet> PendingSheet::release() {
    return std::move(future_);
}

}
