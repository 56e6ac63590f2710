#include "config/settings.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>

#include "utils/log.hpp"

namespace flipbook::settings {
namespace {

std::mutex& cache_mutex() {
    static std::mutex m;
    return m;
}

Settings& cached_settings_ref() {
    static Settings cached{};
    return cached;
}

template <typename T>
void read_field(const nlohmann::json& json, const char* key, T& out) {
    auto it = json.find(key);
    if (it == json.end()) return;
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::type_error&) {
        flipbook::log::warn(std::string("[Settings] ignoring '") + key + "': unexpected type " + it->type_name());
    }
}

void ensure_directory_exists(const std::filesystem::path& dir) {
    if (dir.empty()) {
        return;
    }
    std::error_code ec;
    if (std::filesystem::create_directories(dir, ec)) {
        return;
    }
    if (ec && !std::filesystem::exists(dir)) {
        std::ostringstream oss;
        oss << "Failed to create settings directory '" << dir.u8string() << "': " << ec.message();
        throw std::runtime_error(oss.str());
    }
}

void write_settings_file(const std::filesystem::path& path, const nlohmann::json& json) {
    ensure_directory_exists(path.parent_path());

    std::ofstream out(path);
    if (!out.is_open()) {
        std::ostringstream oss;
        oss << "Unable to open settings file at '" << path.string() << "' for writing.";
        throw std::runtime_error(oss.str());
    }
    out << json.dump(2);
    if (!out.good()) {
        std::ostringstream oss;
        oss << "Failed while writing settings file at '" << path.string() << "'.";
        throw std::runtime_error(oss.str());
    }
}

}

int clamp_grid_size(int value) {
    return std::clamp(value, kMinGridSize, kMaxGridSize);
}

int clamp_fps(int value) {
    return std::clamp(value, kMinFps, kMaxFps);
}

Settings sanitized(Settings settings) {
    settings.columns = clamp_grid_size(settings.columns);
    settings.rows = clamp_grid_size(settings.rows);
    settings.fps = clamp_fps(settings.fps);
    settings.preview_max_size = std::max(1, settings.preview_max_size);
    if (settings.model.empty()) settings.model = Settings{}.model;
    if (settings.output_mime_type.empty()) settings.output_mime_type = Settings{}.output_mime_type;
    if (settings.download_path.empty()) settings.download_path = Settings{}.download_path;
    return settings;
}

nlohmann::json to_json(const Settings& settings) {
    nlohmann::json json = nlohmann::json::object();
    json["version"] = settings.version;
    json["prompt"] = settings.prompt;
    json["columns"] = settings.columns;
    json["rows"] = settings.rows;
    json["fps"] = settings.fps;
    json["playing"] = settings.playing;
    json["preview_max_size"] = settings.preview_max_size;
    json["model"] = settings.model;
    json["output_mime_type"] = settings.output_mime_type;
    json["download_path"] = settings.download_path;
    json["response_path"] = settings.response_path;
    return json;
}

Settings from_json(const nlohmann::json& json) {
    Settings settings;
    if (!json.is_object()) {
        return settings;
    }
    read_field(json, "version", settings.version);
    read_field(json, "prompt", settings.prompt);
    read_field(json, "columns", settings.columns);
    read_field(json, "rows", settings.rows);
    read_field(json, "fps", settings.fps);
    read_field(json, "playing", settings.playing);
    read_field(json, "preview_max_size", settings.preview_max_size);
    read_field(json, "model", settings.model);
    read_field(json, "output_mime_type", settings.output_mime_type);
    read_field(json, "download_path", settings.download_path);
    read_field(json, "response_path", settings.response_path);
    return sanitized(std::move(settings));
}

std::filesystem::path project_root() {
#ifdef FLIPBOOK_PROJECT_ROOT
    return std::filesystem::path(FLIPBOOK_PROJECT_ROOT);
#else
    return std::filesystem::current_path();
#endif
}

std::filesystem::path settings_path() {
    return project_root() / "flipbook_settings.json";
}

Settings load_settings() {
    return load_settings(settings_path());
}

Settings load_settings(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        Settings defaults{};
        write_settings_file(path, to_json(defaults));
        flipbook::log::info("[Settings] created defaults at " + path.string());
        std::lock_guard<std::mutex> lock(cache_mutex());
        cached_settings_ref() = defaults;
        return defaults;
    }

    auto read_once = [&](nlohmann::json& out) -> bool {
        std::ifstream is(path);
        if (!is.is_open()) return false;
        try {
            is >> out;
            return true;
        } catch (const nlohmann::json::parse_error&) {
            return false;
        }
    };

    nlohmann::json json;
    if (!read_once(json)) {
        flipbook::log::warn("[Settings] parse error reading '" + path.string() + "', retrying shortly...");
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        if (!read_once(json)) {
            flipbook::log::warn("[Settings] still unable to parse '" + path.string() + "'; using cached settings");
            std::lock_guard<std::mutex> lock(cache_mutex());
            return cached_settings_ref();
        }
    }

    Settings settings = from_json(json);
    std::lock_guard<std::mutex> lock(cache_mutex());
    cached_settings_ref() = settings;
    return settings;
}

void save_settings(const Settings& settings) {
    save_settings(settings, settings_path());
}

void save_settings(const Settings& settings, const std::filesystem::path& path) {
    const Settings clean = sanitized(settings);
    write_settings_file(path, to_json(clean));
    std::lock_guard<std::mutex> lock(cache_mutex());
    cached_settings_ref() = clean;
}

}
