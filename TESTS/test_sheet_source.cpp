#include "doctest/doctest.h"

#include <chrono>
#include <future>
#include <string>
#include <thread>

#include "sprite/image_handle.hpp"
#include "sprite/sheet_source.hpp"

using namespace flipbook::sprite;

namespace {
// 8x4 RGBA gradient.
constexpr const char* kTinyPng =
    "iVBORw0KGgoAAAANSUhEUgAAAAgAAAAECAYAAACzzX7wAAAAP0lEQVR4nBXKMQHAMAgAMJRMCUpQwjkVVYISDG3pkS8R8X4PSdEchiUi"
    "BZKiOQybN7RAUjSHYfuGEUiK5jAsP/9USEEpfz37AAAAAElFTkSuQmCC";
}

TEST_CASE("sdl image source decodes a data URL") {
    const std::string handle = make_data_url("image/png", kTinyPng);
    const LoadedSheet sheet = SdlImageSheetSource::decode(handle);
    CHECK(sheet.handle == handle);
    CHECK(sheet.dimensions.width == 8);
    CHECK(sheet.dimensions.height == 4);
    REQUIRE(sheet.surface);
    CHECK(sheet.surface->w == 8);
    CHECK_FALSE(sheet.encoded.empty());
}

TEST_CASE("sdl image source reports undecodable bytes through the future") {
    SdlImageSheetSource source;
    std::future<LoadedSheet> future = source.load(make_data_url("image/png", "bm90IGFuIGltYWdl"));
    PendingSheet pending("broken", std::move(future));

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (pending.poll() == PendingSheet::State::Pending && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    CHECK(pending.state() == PendingSheet::State::Failed);
    CHECK_FALSE(pending.error().empty());
}

TEST_CASE("pending sheet without a future fails at once") {
    PendingSheet pending("nothing", std::future<LoadedSheet>{});
    CHECK(pending.state() == PendingSheet::State::Failed);
    CHECK(pending.poll() == PendingSheet::State::Failed);
}
