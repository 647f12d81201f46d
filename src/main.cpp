#include <stdio.h>
#include <string.h>
#include <time.h>

#include <iostream>
#include <string>

#include <curl/curl.h>

#include "Log.h"
#include "SettingsManager.h"
#include "Tide.h"
#include "TideCache.h"
#include "NoaaClient.h"
#include "TideService.h"
#include "TideRenderer.h"
#include "TextGridSink.h"
#include "CanvasSink.h"

//////////////////// DEFINITIONS ///////////////////////////////

#define DEFAULT_SETTINGS_PATH "tide-settings.json"

struct CommandLine {
    bool        toStdout   = false;
    std::string configPath = DEFAULT_SETTINGS_PATH;
    std::string framePath;   // empty: use settings.frame_path
};

static void printUsage(const char* argv0)
{
    fprintf(stderr, "usage: %s [--stdout] [--config <path>] [--frame <path>]\n", argv0);
}

static bool parseCommandLine(int argc, char** argv, CommandLine& cmd)
{
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (strcmp(arg, "--stdout") == 0) {
            cmd.toStdout = true;
        } else if (strcmp(arg, "--config") == 0 && i + 1 < argc) {
            cmd.configPath = argv[++i];
        } else if (strcmp(arg, "--frame") == 0 && i + 1 < argc) {
            cmd.framePath = argv[++i];
        } else {
            Log.printf("[Main] unknown or incomplete argument: %s\n", arg);
            return false;
        }
    }
    return true;
}

static bool renderToStdout(const TideSeries& series)
{
    TextGridSink sink(std::cout);
    return TideRender(series, sink);
}

static bool renderToFrame(const TideSeries& series, const SettingsData& settings, const std::string& framePath)
{
    CanvasSink sink(settings.width, settings.height, settings.font_height,
                    [&framePath](const MonoFrame& frame) {
                        return writeMonoFramePbm(framePath.c_str(), frame);
                    });
    if (!sink.isReady()) {
        Log.println("[Main] bitmap target could not be created");
        return false;
    }
    return TideRender(series, sink);
}

int main(int argc, char** argv)
{
    CommandLine cmd;
    if (!parseCommandLine(argc, argv, cmd)) {
        printUsage(argv[0]);
        return 1;
    }

    // Load or create the settings file
    SettingsData settings;
    initializeSettingsData(cmd.configPath.c_str(), settings);

    Log.println("[Settings] Loaded settings:");
    Log.printf("  station: %s (%s)\n", settings.station_id.c_str(), settings.station_name.c_str());
    Log.printf("  datum: %s (msl_offset %.2f ft)\n",
               settings.show_msl ? "MSL" : "MLLW", static_cast<double>(settings.msl_offset));
    Log.printf("  cache: %s, ttl %u min\n",
               settings.cache_path.c_str(), static_cast<unsigned>(settings.cache_ttl_minutes));

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        // The service still falls back to the cache or the offline model.
        Log.println("[Main] curl_global_init failed");
    }

    TideCache   cache(settings.cache_path, static_cast<uint32_t>(settings.cache_ttl_minutes) * 60u);
    NoaaClient  client(settings.time_window_hours);
    TideService service(cache, client, settings);

    const time_t now = time(nullptr);
    const TideSeries series = service.getCurrentSeries(now);

    Log.printf("[Main] series source=%s, now=%.2f ft\n",
               TideSourceName(series.source),
               static_cast<double>(series.samples[TideSeries::NOW_INDEX].heightFt));

    bool ok;
    if (cmd.toStdout) {
        ok = renderToStdout(series);
    } else {
        const std::string framePath = cmd.framePath.empty() ? settings.frame_path : cmd.framePath;
        ok = renderToFrame(series, settings, framePath);
    }

    curl_global_cleanup();

    if (!ok) {
        Log.println("[Main] render failed");
        return 1;
    }
    Log.println("[Main] done");
    return 0;
}
