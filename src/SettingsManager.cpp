#include "SettingsManager.h"
#include "CanvasSink.h"
#include "Log.h"

#include <ArduinoJson.h>

#include <fstream>

static constexpr size_t SETTINGS_JSON_CAPACITY = 2048;

bool loadSettingsDataFromFile(const char* filePath, SettingsData& settings)
{
    std::ifstream file(filePath);
    if (!file) {
        Log.printf("[Settings] Failed to open %s for reading\n", filePath);
        return false;
    }

    DynamicJsonDocument doc(SETTINGS_JSON_CAPACITY);

    DeserializationError error = deserializeJson(doc, file);
    if (error) {
        Log.printf("[Settings] Failed to read %s: %s\n", filePath, error.c_str());
        return false;
    }

    // Parse into a copy so a half-read file never leaks into the caller's settings.
    SettingsData loaded = settings;

    JsonObject station = doc["station"];
    if (!station.isNull()) {
        loaded.station_id   = station["id"]         | loaded.station_id;
        loaded.station_name = station["name"]       | loaded.station_name;
        loaded.msl_offset   = station["msl_offset"] | loaded.msl_offset;
        loaded.show_msl     = station["show_msl"]   | loaded.show_msl;
    }

    JsonObject display = doc["display"];
    if (!display.isNull()) {
        loaded.time_window_hours = display["time_window_hours"] | loaded.time_window_hours;
        loaded.cache_ttl_minutes = display["cache_ttl_minutes"] | loaded.cache_ttl_minutes;
        loaded.width             = display["width"]             | loaded.width;
        loaded.height            = display["height"]            | loaded.height;
        loaded.font_height       = display["font_height"]       | loaded.font_height;
    }

    JsonObject files = doc["files"];
    if (!files.isNull()) {
        loaded.cache_path = files["cache_path"] | loaded.cache_path;
        loaded.frame_path = files["frame_path"] | loaded.frame_path;
    }

    settings = loaded;
    Log.printf("[Settings] Loaded settings for station %s (%s)\n",
               settings.station_id.c_str(), settings.station_name.c_str());
    return true;
}


bool saveSettingsDataToFile(const char* filePath, const SettingsData& settings)
{
    std::ofstream file(filePath, std::ios::out | std::ios::trunc);
    if (!file) {
        Log.printf("[Settings] Failed to open %s for writing\n", filePath);
        return false;
    }

    DynamicJsonDocument doc(SETTINGS_JSON_CAPACITY);

    JsonObject station = doc.createNestedObject("station");
    station["id"]         = settings.station_id;
    station["name"]       = settings.station_name;
    station["msl_offset"] = settings.msl_offset;
    station["show_msl"]   = settings.show_msl;

    JsonObject display = doc.createNestedObject("display");
    display["time_window_hours"] = settings.time_window_hours;
    display["cache_ttl_minutes"] = settings.cache_ttl_minutes;
    display["width"]             = settings.width;
    display["height"]            = settings.height;
    display["font_height"]       = settings.font_height;

    JsonObject files = doc.createNestedObject("files");
    files["cache_path"] = settings.cache_path;
    files["frame_path"] = settings.frame_path;

    if (serializeJsonPretty(doc, file) == 0) {
        Log.println("[Settings] Failed to write settings file");
        return false;
    }

    file.flush();
    if (!file) {
        Log.printf("[Settings] Write to %s failed\n", filePath);
        return false;
    }

    Log.printf("[Settings] Settings saved to %s\n", filePath);
    return true;
}


bool validateSettingsData(SettingsData& settings)
{
    bool clean = true;

    if (settings.station_id.empty()) {
        Log.println("[Settings] station id empty, using default");
        settings.station_id = SettingsData().station_id;
        clean = false;
    }
    if (settings.time_window_hours != SETTINGS_WINDOW_HOURS) {
        // The chart is always 145 samples at 10-minute steps.
        Log.printf("[Settings] time_window_hours=%u unsupported, using %u\n",
                   static_cast<unsigned>(settings.time_window_hours),
                   static_cast<unsigned>(SETTINGS_WINDOW_HOURS));
        settings.time_window_hours = SETTINGS_WINDOW_HOURS;
        clean = false;
    }
    if (settings.cache_ttl_minutes < 1) {
        Log.println("[Settings] cache_ttl_minutes < 1, using 1");
        settings.cache_ttl_minutes = 1;
        clean = false;
    }
    if (settings.width < SETTINGS_MIN_WIDTH) {
        Log.printf("[Settings] width=%u too small, using %u\n",
                   static_cast<unsigned>(settings.width),
                   static_cast<unsigned>(SETTINGS_MIN_WIDTH));
        settings.width = SETTINGS_MIN_WIDTH;
        clean = false;
    }
    if (settings.font_height < SETTINGS_MIN_FONT || settings.font_height > SETTINGS_MAX_FONT) {
        uint16_t fixed = (settings.font_height < SETTINGS_MIN_FONT) ? SETTINGS_MIN_FONT
                                                                    : SETTINGS_MAX_FONT;
        Log.printf("[Settings] font_height=%u out of range, using %u\n",
                   static_cast<unsigned>(settings.font_height),
                   static_cast<unsigned>(fixed));
        settings.font_height = fixed;
        clean = false;
    }
    // Height depends on the font: the canvas needs plot rows between the
    // status line and the axis labels.
    uint16_t minHeight = SETTINGS_MIN_HEIGHT;
    const int fontMinHeight = canvasMinimumHeight(settings.font_height);
    if (fontMinHeight > minHeight) minHeight = static_cast<uint16_t>(fontMinHeight);
    if (settings.height < minHeight) {
        Log.printf("[Settings] height=%u too small for font_height=%u, using %u\n",
                   static_cast<unsigned>(settings.height),
                   static_cast<unsigned>(settings.font_height),
                   static_cast<unsigned>(minHeight));
        settings.height = minHeight;
        clean = false;
    }

    return clean;
}


void initializeSettingsData(const char* filePath, SettingsData& settings)
{
    std::ifstream existing(filePath);
    if (!existing) {
        Log.printf("[Settings] File %s does not exist. Creating a default file.\n", filePath);
        settings = SettingsData();
        if (!saveSettingsDataToFile(filePath, settings)) {
            Log.println("[Settings] Continuing with in-memory defaults");
        }
    }
    else
    {
        existing.close();
        if (!loadSettingsDataFromFile(filePath, settings)) {
            Log.println("[Settings] Using default settings");
            settings = SettingsData();
        }
    }

    validateSettingsData(settings);
}
