#include "sprite/sprite_player.hpp"

#include <chrono>
#include <utility>

#include "utils/log.hpp"

namespace flipbook::sprite {
namespace {

std::string describe(const SheetDimensions& dims) {
    return std::to_string(dims.width) + "x" + std::to_string(dims.height);
}

std::string describe(const GridShape& grid) {
    return std::to_string(grid.columns) + "x" + std::to_string(grid.rows);
}

}

SpritePlayer::SpritePlayer(std::shared_ptr<SheetSource> source, TickSource ticks)
    : source_(std::move(source)), clock_(std::move(ticks)) {}

SpritePlayer::~SpritePlayer() {
    retire_pending();
    for (auto& future : retired_) {
        if (!future.valid()) continue;
        try {
            future.get();
        } catch (const std::exception& ex) {
            flipbook::log::debug(std::string("[SpritePlayer] discarded load failed: ") + ex.what());
        }
    }
}

void SpritePlayer::load(const std::string& handle) {
    retire_pending();
    clock_.reset();
    clock_.clear_layout();
    sheet_.reset();
    load_error_.clear();
    handle_ = handle;

    if (!source_) {
        state_ = LoadState::Failed;
        load_error_ = "no image source configured";
        flipbook::log::error("[SpritePlayer] " + load_error_);
        return;
    }

    try {
        pending_.emplace(handle, source_->load(handle));
        state_ = LoadState::Pending;
        flipbook::log::debug("[SpritePlayer] loading sheet (" + std::to_string(handle.size()) + " byte handle)");
    } catch (const ImageLoadError& ex) {
        pending_.reset();
        state_ = LoadState::Failed;
        load_error_ = ex.what();
        flipbook::log::error(std::string("[SpritePlayer] sheet load failed: ") + ex.what());
    }
    // A source may complete synchronously.
    poll_load();
}

void SpritePlayer::clear() {
    retire_pending();
    clock_.reset();
    clock_.clear_layout();
    const bool had_sheet = sheet_.has_value();
    sheet_.reset();
    state_ = LoadState::Empty;
    handle_.clear();
    load_error_.clear();
    if (had_sheet) {
        ++sheet_revision_;
    }
    flipbook::log::debug("[SpritePlayer] cleared");
}

bool SpritePlayer::poll_load() {
    prune_retired();
    if (!pending_) {
        return false;
    }

    switch (pending_->poll()) {
        case PendingSheet::State::Pending:
            return false;
        case PendingSheet::State::Failed:
            state_ = LoadState::Failed;
            load_error_ = pending_->error();
            pending_.reset();
            flipbook::log::error("[SpritePlayer] sheet load failed: " + load_error_);
            return false;
        case PendingSheet::State::Loaded:
            break;
    }

    LoadedSheet loaded = pending_->take_sheet();
    pending_.reset();

    // Resolve before touching any state so a bad sheet leaves nothing half installed.
    FrameGeometry geometry;
    try {
        geometry = resolve(loaded.dimensions, grid_, frame_count());
    } catch (const InvalidGeometry& ex) {
        state_ = LoadState::Failed;
        load_error_ = ex.what();
        flipbook::log::error("[SpritePlayer] unusable sheet: " + load_error_);
        return false;
    }

    clock_.reset();
    clock_.set_layout(grid_, frame_count(), geometry);
    sheet_ = std::move(loaded);
    state_ = LoadState::Loaded;
    ++sheet_revision_;

    flipbook::log::info("[SpritePlayer] sheet " + describe(sheet_->dimensions) + " grid " + describe(grid_) +
                        " -> frame " + std::to_string(geometry.frame_width) + "x" +
                        std::to_string(geometry.frame_height) + ", " +
                        std::to_string(geometry.effective_rows) + " rows");
    return true;
}

bool SpritePlayer::update() {
    const bool arrived = poll_load();
    const bool advanced = clock_.update();
    return arrived || advanced;
}

void SpritePlayer::set_grid(const GridShape& grid) {
    if (grid.columns == grid_.columns && grid.rows == grid_.rows) {
        return;
    }
    if (!sheet_) {
        grid_ = grid;
        return;
    }
    const FrameGeometry geometry = resolve(sheet_->dimensions, grid, grid.frame_count());
    grid_ = grid;
    clock_.set_layout(grid_, frame_count(), geometry);
    flipbook::log::debug("[SpritePlayer] grid changed to " + describe(grid_));
}

double SpritePlayer::preview_scale(double max_preview_size) const {
    return sprite::preview_scale(clock_.geometry(), max_preview_size);
}

void SpritePlayer::retire_pending() {
    if (!pending_) return;
    if (pending_->state() == PendingSheet::State::Pending) {
        std::future<LoadedSheet> future = pending_->release();
        if (future.valid()) {
            retired_.push_back(std::move(future));
        }
    }
    pending_.reset();
}

void SpritePlayer::prune_retired() {
    auto it = retired_.begin();
    while (it != retired_.end()) {
        if (!it->valid()) {
            it = retired_.erase(it);
            continue;
        }
        if (it->wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            ++it;
            continue;
        }
        try {
            it->get();
        } catch (const std::exception& ex) {
            flipbook::log::debug(std::string("[SpritePlayer] superseded load failed: ") + ex.what());
        }
        it = retired_.erase(it);
    }
}

}
