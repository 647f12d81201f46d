#pragma once

#include <stdint.h>
#include <string>

// Startup configuration. Built once in main() and passed around by const reference.
struct SettingsData {
    // Station
    std::string station_id   = "8418150";
    std::string station_name = "Portland, ME";
    float       msl_offset   = 4.9f;    // MLLW -> MSL, feet
    bool        show_msl     = false;   // false: plot raw MLLW heights

    // Display
    uint16_t time_window_hours = 12;
    uint16_t cache_ttl_minutes = 30;
    uint16_t width             = 400;   // bitmap target, px
    uint16_t height            = 300;
    uint16_t font_height       = 20;

    // Files
    std::string cache_path = "/tmp/tide_cache.json";
    std::string frame_path = "/tmp/tide_frame.pbm";
};

static constexpr uint16_t SETTINGS_WINDOW_HOURS = 12;
static constexpr uint16_t SETTINGS_MIN_WIDTH    = 64;
static constexpr uint16_t SETTINGS_MIN_HEIGHT   = 48;    // raised further for larger fonts
static constexpr uint16_t SETTINGS_MIN_FONT     = 8;
static constexpr uint16_t SETTINGS_MAX_FONT     = 20;    // largest font built into lvgl

bool loadSettingsDataFromFile(const char* filePath, SettingsData& settings);
bool saveSettingsDataToFile(const char* filePath, const SettingsData& settings);

// Loads filePath into settings; writes a default file if none exists.
// Always leaves settings valid (see validateSettingsData).
void initializeSettingsData(const char* filePath, SettingsData& settings);

// Clamps out-of-range values and logs each correction.
// Returns true if nothing had to be changed.
bool validateSettingsData(SettingsData& settings);
