#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "sprite/frame_geometry.hpp"

namespace flipbook::settings {

inline constexpr int kMinGridSize = 1;
inline constexpr int kMaxGridSize = 16;
inline constexpr int kMinFps = 1;
inline constexpr int kMaxFps = 60;

struct Settings {
    int version = 1;
    std::string prompt;
    int columns = 4;
    int rows = 4;
    int fps = 12;
    bool playing = true;
    int preview_max_size = 256;
    std::string model = "imagen-4.0-generate-001";
    std::string output_mime_type = "image/png";
    std::string download_path = "sprite-sheet.png";
    // Saved service response replayed by the offline generation backend; empty disables it.
    std::string response_path;

    sprite::GridShape grid() const { return sprite::GridShape{ columns, rows }; }
    int frame_count() const { return columns * rows; }
};

int clamp_grid_size(int value);
int clamp_fps(int value);

// Applies every clamp; the result is safe to hand to the sprite core.
Settings sanitized(Settings settings);

nlohmann::json to_json(const Settings& settings);
// Missing or mistyped keys keep their defaults. The result is sanitized.
Settings from_json(const nlohmann::json& json);

std::filesystem::path project_root();
std::filesystem::path settings_path();

// Creates the file with defaults when absent. A parse error is retried once, then the last
// successfully loaded settings are returned.
Settings load_settings();
Settings load_settings(const std::filesystem::path& path);

// Throws std::runtime_error when the file cannot be written.
void save_settings(const Settings& settings);
void save_settings(const Settings& settings, const std::filesystem::path& path);

}
