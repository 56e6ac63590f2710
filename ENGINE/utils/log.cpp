#include "log.hpp"

#include <atomic>
#include <chrono>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace {

using flipbook::log::Level;

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

Level& global_level() {
    static Level lvl = Level::Info;
    return lvl;
}

std::atomic<bool>& env_init_flag() {
    static std::atomic<bool> f{false};
    return f;
}

std::unique_ptr<std::ofstream>& file_sink() {
    static std::unique_ptr<std::ofstream> f{};
    return f;
}

flipbook::log::Sink& observer_sink() {
    static flipbook::log::Sink sink;
    return sink;
}

std::chrono::steady_clock::time_point& time_origin() {
    static auto t0 = std::chrono::steady_clock::now();
    return t0;
}

bool env_flag(const char* value) {
    return value && (*value == '1' || *value == 'y' || *value == 'Y' || *value == 't' || *value == 'T');
}

Level parse_level_env(std::string_view v) {
    std::string lower(v);
    for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "error") return Level::Error;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "info") return Level::Info;
    if (lower == "debug") return Level::Debug;
    return Level::Info;
}

void init_from_env_once() {
    bool expected = false;
    if (!env_init_flag().compare_exchange_strong(expected, true)) {
        return;
    }
    if (const char* v = std::getenv("FLIPBOOK_LOG_LEVEL")) {
        global_level() = parse_level_env(v);
    }

    const char* file = std::getenv("FLIPBOOK_LOG_FILE");
    if (file && *file) {
        std::ios_base::openmode mode = std::ios::out;
        mode |= env_flag(std::getenv("FLIPBOOK_LOG_APPEND")) ? std::ios::app : std::ios::trunc;
        auto ofs = std::make_unique<std::ofstream>(file, mode);
        if (ofs->good()) {
            file_sink() = std::move(ofs);
        } else {
            std::cerr << "[WARN] unable to open FLIPBOOK_LOG_FILE '" << file << "'\n";
        }
    }
}

std::string format_elapsed(double secs) {
    std::ostringstream ss;
    ss.setf(std::ios::fixed);
    ss << std::setprecision(3) << secs;
    return ss.str();
}

void log_line_impl(Level level, const std::string& message) {
    init_from_env_once();
    flipbook::log::Sink observer;
    {
        std::lock_guard<std::mutex> lock(log_mutex());
        if (static_cast<int>(level) > static_cast<int>(global_level())) {
            return;
        }
        using namespace std::chrono;
        const double secs = duration_cast<duration<double>>(steady_clock::now() - time_origin()).count();
        const std::string line = std::string("[") + flipbook::log::level_tag(level) + "] +" +
                                 format_elapsed(secs) + "s: " + message + '\n';
        std::ostream& os = (level == Level::Error) ? std::cerr : std::cout;
        os << line;
        os.flush();
        if (file_sink()) {
            (*file_sink()) << line;
            file_sink()->flush();
        }
        observer = observer_sink();
    }
    // Called outside the lock so a sink may log.
    if (observer) {
        observer(level, message);
    }
}

}

namespace flipbook::log {

void set_level(Level level) {
    init_from_env_once();
    std::lock_guard<std::mutex> lock(log_mutex());
    global_level() = level;
}

Level level() {
    init_from_env_once();
    std::lock_guard<std::mutex> lock(log_mutex());
    return global_level();
}

void set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(log_mutex());
    observer_sink() = std::move(sink);
}

void clear_sink() {
    set_sink(nullptr);
}

const char* level_tag(Level level) {
    switch (level) {
        case Level::Error: return "ERROR";
        case Level::Warn:  return "WARN";
        case Level::Info:  return "INFO";
        case Level::Debug: return "DEBUG";
        default:           return "INFO";
    }
}

void error(const std::string& message) { log_line_impl(Level::Error, message); }
void warn (const std::string& message) { log_line_impl(Level::Warn,  message); }
void info (const std::string& message) { log_line_impl(Level::Info,  message); }
void debug(const std::string& message) { log_line_impl(Level::Debug, message); }

ScopedLevel::ScopedLevel(Level next)
    : previous_(level()) {
    set_level(next);
}

ScopedLevel::~ScopedLevel() {
    set_level(previous_);
}

}
