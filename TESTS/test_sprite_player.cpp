#include "doctest/doctest.h"

#include <cstdint>
#include <exception>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "sprite/load_observer.hpp"
#include "sprite/sprite_player.hpp"
#include "utils/log.hpp"

using namespace flipbook::sprite;

namespace {

// Sheets of known size keyed by handle. Deferred handles stay pending until complete() is called;
// anything unknown fails the way an undecodable image does.
class FakeSheetSource : public SheetSource {
public:
    std::map<std::string, SheetDimensions> sizes;
    std::vector<std::string> deferred;
    std::vector<std::string> requested;

    std::future<LoadedSheet> load(const std::string& handle) override {
        requested.push_back(handle);
        std::promise<LoadedSheet> promise;
        std::future<LoadedSheet> future = promise.get_future();
        for (const auto& d : deferred) {
            if (d == handle) {
                waiting_.emplace_back(handle, std::move(promise));
                return future;
            }
        }
        settle(handle, promise);
        return future;
    }

    void complete(const std::string& handle) {
        for (auto it = waiting_.begin(); it != waiting_.end(); ++it) {
            if (it->first == handle) {
                settle(handle, it->second);
                waiting_.erase(it);
                return;
            }
        }
    }

    void complete_all() {
        for (auto& entry : waiting_) {
            settle(entry.first, entry.second);
        }
        waiting_.clear();
    }

private:
    void settle(const std::string& handle, std::promise<LoadedSheet>& promise) {
        auto it = sizes.find(handle);
        if (it == sizes.end()) {
            promise.set_exception(std::make_exception_ptr(ImageLoadError("no such image: " + handle)));
            return;
        }
        LoadedSheet sheet;
        sheet.handle = handle;
        sheet.dimensions = it->second;
        sheet.encoded = { 0x89, 'P', 'N', 'G' };
        promise.set_value(std::move(sheet));
    }

    std::vector<std::pair<std::string, std::promise<LoadedSheet>>> waiting_;
};

struct Fixture {
    std::uint64_t now = 5000;
    std::shared_ptr<FakeSheetSource> source = std::make_shared<FakeSheetSource>();

    Fixture() { flipbook::log::set_level(flipbook::log::Level::Warn); }

    TickSource ticks() { return [this]() { return now; }; }
};

}

TEST_CASE("sprite player loads, resolves and animates a sheet") {
    Fixture fx;
    fx.source->sizes["knight.png"] = SheetDimensions{512, 512};
    SpritePlayer player(fx.source, fx.ticks());
    player.set_fps(10.0);

    CHECK(player.load_state() == SpritePlayer::LoadState::Empty);
    CHECK(player.grid().columns == 4);
    CHECK(player.grid().rows == 4);

    player.load("knight.png");
    REQUIRE(player.load_state() == SpritePlayer::LoadState::Loaded);
    CHECK(player.sheet_revision() == 1);
    REQUIRE(player.sheet() != nullptr);
    CHECK(player.sheet()->encoded.size() == 4);
    CHECK(player.geometry().frame_width == 128.0);
    CHECK(player.geometry().frame_height == 128.0);
    CHECK(player.frame_count() == 16);
    CHECK(player.current_frame() == 0);
    CHECK_FALSE(player.is_running());

    player.play();
    fx.now += 100;
    CHECK(player.update());
    CHECK(player.current_frame() == 1);
    CHECK(player.offset().x == -128.0);
    CHECK(player.offset().y == 0.0);

    fx.now += 1500;
    player.update();
    CHECK(player.current_frame() == 0);
}

TEST_CASE("sprite player waits for an asynchronous decode") {
    Fixture fx;
    fx.source->sizes["slow.png"] = SheetDimensions{256, 128};
    fx.source->deferred = { "slow.png" };
    SpritePlayer player(fx.source, fx.ticks());

    player.load("slow.png");
    CHECK(player.load_state() == SpritePlayer::LoadState::Pending);
    CHECK_FALSE(player.geometry().resolved());
    CHECK(player.sheet() == nullptr);
    CHECK_FALSE(player.update());

    fx.source->complete("slow.png");
    CHECK(player.update());
    CHECK(player.load_state() == SpritePlayer::LoadState::Loaded);
    CHECK(player.geometry().frame_width == 64.0);
    CHECK(player.geometry().frame_height == 32.0);
}

TEST_CASE("sprite player new load mid playback resets and silences the old timer") {
    Fixture fx;
    fx.source->sizes["walk.png"] = SheetDimensions{512, 512};
    fx.source->sizes["run.png"] = SheetDimensions{256, 256};
    fx.source->deferred = { "run.png" };
    SpritePlayer player(fx.source, fx.ticks());
    player.set_fps(10.0);

    player.load("walk.png");
    player.play();
    fx.now += 500;
    player.update();
    REQUIRE(player.current_frame() == 5);

    player.load("run.png");
    CHECK(player.load_state() == SpritePlayer::LoadState::Pending);
    CHECK(player.current_frame() == 0);
    CHECK_FALSE(player.is_running());
    CHECK_FALSE(player.clock().timer_armed());
    CHECK_FALSE(player.geometry().resolved());
    CHECK(player.sheet() == nullptr);

    fx.now += 1000;
    CHECK_FALSE(player.update());
    CHECK(player.current_frame() == 0);

    fx.source->complete("run.png");
    CHECK(player.update());
    CHECK(player.load_state() == SpritePlayer::LoadState::Loaded);
    CHECK(player.handle() == "run.png");
    CHECK(player.sheet_revision() == 2);
    CHECK(player.current_frame() == 0);
    CHECK_FALSE(player.is_running());
    CHECK(player.geometry().frame_width == 64.0);

    fx.now += 1000;
    CHECK_FALSE(player.update());
    CHECK(player.current_frame() == 0);
}

TEST_CASE("sprite player ignores a superseded load that finishes late") {
    Fixture fx;
    fx.source->sizes["first.png"] = SheetDimensions{400, 400};
    fx.source->sizes["second.png"] = SheetDimensions{800, 800};
    fx.source->deferred = { "first.png", "second.png" };
    SpritePlayer player(fx.source, fx.ticks());

    player.load("first.png");
    player.load("second.png");
    REQUIRE(fx.source->requested.size() == 2);

    fx.source->complete("first.png");
    CHECK_FALSE(player.update());
    CHECK(player.load_state() == SpritePlayer::LoadState::Pending);
    CHECK(player.sheet_revision() == 0);

    fx.source->complete("second.png");
    CHECK(player.update());
    CHECK(player.handle() == "second.png");
    CHECK(player.geometry().frame_width == 200.0);
}

TEST_CASE("sprite player reports decode failures") {
    Fixture fx;
    SpritePlayer player(fx.source, fx.ticks());

    player.load("missing.png");
    CHECK(player.load_state() == SpritePlayer::LoadState::Failed);
    CHECK(player.load_error().find("no such image") != std::string::npos);
    CHECK(player.sheet() == nullptr);
    CHECK_FALSE(player.geometry().resolved());

    player.play();
    CHECK_FALSE(player.clock().timer_armed());
}

TEST_CASE("sprite player treats an empty image as a failed load") {
    Fixture fx;
    fx.source->sizes["blank.png"] = SheetDimensions{0, 0};
    SpritePlayer player(fx.source, fx.ticks());

    player.load("blank.png");
    CHECK(player.load_state() == SpritePlayer::LoadState::Failed);
    CHECK_FALSE(player.load_error().empty());
    CHECK(player.sheet() == nullptr);
    CHECK(player.sheet_revision() == 0);
}

TEST_CASE("sprite player without a source fails every load") {
    flipbook::log::ScopedLevel quiet(flipbook::log::Level::Error);
    SpritePlayer player(nullptr, [] { return std::uint64_t{0}; });
    player.load("anything.png");
    CHECK(player.load_state() == SpritePlayer::LoadState::Failed);
    CHECK_FALSE(player.load_error().empty());
}

TEST_CASE("sprite player grid edits rewind and keep the running state") {
    Fixture fx;
    fx.source->sizes["sheet.png"] = SheetDimensions{512, 512};
    SpritePlayer player(fx.source, fx.ticks());
    player.set_fps(10.0);

    player.set_grid(GridShape{8, 2});
    CHECK(player.frame_count() == 16);
    CHECK_FALSE(player.geometry().resolved());

    player.load("sheet.png");
    CHECK(player.geometry().frame_width == 64.0);
    CHECK(player.geometry().frame_height == 256.0);

    player.play();
    fx.now += 300;
    player.update();
    REQUIRE(player.current_frame() == 3);

    player.set_grid(GridShape{2, 2});
    CHECK(player.current_frame() == 0);
    CHECK(player.is_running());
    CHECK(player.frame_count() == 4);
    CHECK(player.geometry().frame_width == 256.0);
    CHECK(player.geometry().frame_height == 256.0);

    fx.now += 100;
    CHECK(player.update());
    CHECK(player.current_frame() == 1);
    CHECK(player.offset().x == -256.0);

    // Same shape again is not an edit.
    player.set_grid(GridShape{2, 2});
    CHECK(player.current_frame() == 1);

    CHECK_THROWS_AS(player.set_grid(GridShape{0, 2}), InvalidGeometry);
    CHECK(player.grid().columns == 2);
}

TEST_CASE("sprite player preview scale fits the frame into the panel") {
    Fixture fx;
    fx.source->sizes["tiny.png"] = SheetDimensions{128, 128};
    SpritePlayer player(fx.source, fx.ticks());
    CHECK(player.preview_scale(256.0) == 1.0);

    player.load("tiny.png");
    CHECK(player.preview_scale(256.0) == 8.0);
}

TEST_CASE("sprite player destructor drains loads still in flight") {
    Fixture fx;
    fx.source->sizes["late.png"] = SheetDimensions{64, 64};
    fx.source->deferred = { "late.png" };
    {
        SpritePlayer player(fx.source, fx.ticks());
        player.load("late.png");
        fx.source->complete_all();
    }
    CHECK(fx.source->requested.size() == 1);
}

TEST_CASE("sprite player clear drops the sheet and stops the animation") {
    Fixture fx;
    fx.source->sizes["knight.png"] = SheetDimensions{512, 512};
    SpritePlayer player(fx.source, fx.ticks());
    player.set_fps(10.0);
    player.load("knight.png");
    player.play();
    fx.now += 250;
    player.update();
    REQUIRE(player.current_frame() == 2);
    const std::uint64_t shown = player.sheet_revision();

    player.clear();
    CHECK(player.load_state() == SpritePlayer::LoadState::Empty);
    CHECK(player.sheet() == nullptr);
    CHECK(player.handle().empty());
    CHECK(player.sheet_revision() != shown);
    CHECK_FALSE(player.geometry().resolved());
    CHECK_FALSE(player.clock().timer_armed());
    CHECK(player.current_frame() == 0);

    fx.now += 1000;
    CHECK_FALSE(player.update());
    CHECK(player.current_frame() == 0);

    // Nothing left to drop.
    const std::uint64_t cleared = player.sheet_revision();
    player.clear();
    CHECK(player.sheet_revision() == cleared);
}

TEST_CASE("sprite player clear discards a load still decoding") {
    Fixture fx;
    fx.source->sizes["slow.png"] = SheetDimensions{256, 256};
    fx.source->deferred = { "slow.png" };
    SpritePlayer player(fx.source, fx.ticks());

    player.load("slow.png");
    REQUIRE(player.load_state() == SpritePlayer::LoadState::Pending);
    player.clear();

    fx.source->complete("slow.png");
    CHECK_FALSE(player.update());
    CHECK(player.load_state() == SpritePlayer::LoadState::Empty);
    CHECK(player.sheet() == nullptr);
    CHECK(player.sheet_revision() == 0);
}

TEST_CASE("load observer reports a sheet that loads inside load()") {
    Fixture fx;
    fx.source->sizes["knight.png"] = SheetDimensions{512, 512};
    SpritePlayer player(fx.source, fx.ticks());
    LoadObserver observer;

    CHECK(observer.observe(player) == LoadObserver::Event::None);

    observer.expect(player);
    player.load("knight.png");
    REQUIRE(player.load_state() == SpritePlayer::LoadState::Loaded);
    player.update();
    CHECK(observer.observe(player) == LoadObserver::Event::Arrived);
    CHECK(observer.observe(player) == LoadObserver::Event::None);

    // Reloading the same handle is a new arrival.
    observer.expect(player);
    player.load("knight.png");
    CHECK(observer.observe(player) == LoadObserver::Event::Arrived);
}

TEST_CASE("load observer waits for an asynchronous decode") {
    Fixture fx;
    fx.source->sizes["slow.png"] = SheetDimensions{256, 256};
    fx.source->deferred = { "slow.png" };
    SpritePlayer player(fx.source, fx.ticks());
    LoadObserver observer;

    observer.expect(player);
    player.load("slow.png");
    player.update();
    CHECK(observer.observe(player) == LoadObserver::Event::None);

    fx.source->complete("slow.png");
    player.update();
    CHECK(observer.observe(player) == LoadObserver::Event::Arrived);
}

TEST_CASE("load observer reports each failed attempt once") {
    Fixture fx;
    SpritePlayer player(fx.source, fx.ticks());
    LoadObserver observer;

    observer.expect(player);
    player.load("missing.png");
    CHECK(observer.observe(player) == LoadObserver::Event::Failed);
    CHECK(observer.observe(player) == LoadObserver::Event::None);

    observer.expect(player);
    player.load("missing.png");
    CHECK(observer.observe(player) == LoadObserver::Event::Failed);
}

TEST_CASE("load observer stays quiet after cancel") {
    Fixture fx;
    fx.source->sizes["slow.png"] = SheetDimensions{256, 256};
    fx.source->deferred = { "slow.png" };
    SpritePlayer player(fx.source, fx.ticks());
    LoadObserver observer;

    observer.expect(player);
    player.load("slow.png");
    observer.cancel();
    player.clear();

    fx.source->complete("slow.png");
    player.update();
    CHECK(observer.observe(player) == LoadObserver::Event::None);
}
