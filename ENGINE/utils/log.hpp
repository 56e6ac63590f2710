#pragma once

#include <functional>
#include <string>

namespace flipbook::log {

enum class Level {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3,
};

// Receives every line that passes the level filter, after it was written to the console.
using Sink = std::function<void(Level, const std::string&)>;

void set_level(Level level);
Level level();

void set_sink(Sink sink);
void clear_sink();

const char* level_tag(Level level);

void error(const std::string& message);
void warn(const std::string& message);
void info(const std::string& message);
void debug(const std::string& message);

class ScopedLevel {
public:
    explicit ScopedLevel(Level next);
    ~ScopedLevel();

    ScopedLevel(const ScopedLevel&) = delete;
    ScopedLevel& operator=(const ScopedLevel&) = delete;

private:
    Level previous_;
};

}
