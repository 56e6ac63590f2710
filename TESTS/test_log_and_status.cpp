#include "doctest/doctest.h"

#include <string>
#include <utility>
#include <vector>

#include "utils/log.hpp"
#include "utils/status_notifier.hpp"

using flipbook::log::Level;

TEST_CASE("log level filters lines before they reach the sink") {
    std::vector<std::pair<Level, std::string>> seen;
    flipbook::log::set_sink([&seen](Level level, const std::string& message) {
        seen.emplace_back(level, message);
    });

    {
        flipbook::log::ScopedLevel scoped(Level::Warn);
        flipbook::log::debug("hidden debug");
        flipbook::log::info("hidden info");
        flipbook::log::warn("shown warn");
        flipbook::log::error("shown error");
        CHECK(flipbook::log::level() == Level::Warn);
    }
    flipbook::log::clear_sink();
    flipbook::log::warn("after clear");

    REQUIRE(seen.size() == 2);
    CHECK(seen[0].first == Level::Warn);
    CHECK(seen[0].second == "shown warn");
    CHECK(seen[1].first == Level::Error);
}

TEST_CASE("log scoped level restores the previous level") {
    flipbook::log::set_level(Level::Info);
    {
        flipbook::log::ScopedLevel scoped(Level::Debug);
        CHECK(flipbook::log::level() == Level::Debug);
    }
    CHECK(flipbook::log::level() == Level::Info);
    flipbook::log::set_level(Level::Warn);

    CHECK(std::string(flipbook::log::level_tag(Level::Error)) == "ERROR");
    CHECK(std::string(flipbook::log::level_tag(Level::Debug)) == "DEBUG");
}

TEST_CASE("status notifier forwards messages and logs failures as errors") {
    flipbook::log::ScopedLevel scoped(Level::Error);
    std::vector<std::string> logged;
    flipbook::log::set_sink([&logged](Level level, const std::string& message) {
        if (level == Level::Error) logged.push_back(message);
    });

    std::vector<std::pair<flipbook::status::Kind, std::string>> shown;
    {
        flipbook::status::ScopedNotifier notifier([&shown](flipbook::status::Kind kind, const std::string& message) {
            shown.emplace_back(kind, message);
        });
        flipbook::status::progress("Generating your sprite sheet...");
        flipbook::status::ready("Total Frames: 16");
        flipbook::status::failure("Generation Failed: boom");
    }
    flipbook::status::ready("nobody listening");
    flipbook::log::clear_sink();

    REQUIRE(shown.size() == 3);
    CHECK(shown[0].first == flipbook::status::Kind::Progress);
    CHECK(shown[1].second == "Total Frames: 16");
    CHECK(shown[2].first == flipbook::status::Kind::Failure);

    REQUIRE(logged.size() == 1);
    CHECK(logged[0] == "[Status] Generation Failed: boom");
}
