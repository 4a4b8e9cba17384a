/**
 * @file main.cpp
 * @brief Log Watchdog - Main entry point
 *
 * Watches an on-screen event log, OCRs new entries and posts the ones that
 * match configured triggers to a Discord webhook.
 *
 * Requirements:
 * - Tesseract 5 (LSTM) + Leptonica
 * - OpenCV 4
 * - X11 for live capture (or --image for offline runs)
 */

// Pipeline:
// X11 capture -> upscale -> Tesseract lines -> header segmentation -> per-entry re-OCR
// -> dedup -> trigger -> webhook

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include "capture/screen_capture.h"
#include "capture/x11_capture.h"
#include "detection/trigger_resolver.h"
#include "notify/discord_notifier.h"
#include "ocr/tesseract_engine.h"
#include "types.h"
#include "utils/config_loader.h"
#include "utils/logger.h"
#include "utils/profiler.h"
#include "utils/string_utils.h"
#include "utils/timer.h"
#include "watch/watch_loop.h"

// Global flag for graceful shutdown
std::atomic<bool> g_running{true};

using namespace log_watchdog;

void signalHandler(int signal) {
    (void)signal;
    g_running = false;
}

void printBanner() {
    std::cout << R"(
╔═══════════════════════════════════════════════════════════════╗
║         Log Watchdog v1.0                                     ║
║         Tesseract OCR -> Discord webhook                      ║
╚═══════════════════════════════════════════════════════════════╝
)" << std::endl;
}

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n\n"
              << "Options:\n"
              << "  --config <path>    Path to config file (default: " << kDefaultConfigPath << ")\n"
              << "  --image <path>     Offline mode: use a still image as the screen\n"
              << "  --display <name>   X11 display to capture (default: $DISPLAY)\n"
              << "  --roi <x,y,w,h>    Override the capture region from the config\n"
              << "  --set-roi <x,y,w,h> Write the capture region into the config and exit\n"
              << "  --once             Process a single frame and exit\n"
              << "  --max-frames <n>   Stop after N frames (0 = run until interrupted)\n"
              << "  --interval <ms>    Override capture_interval_ms\n"
              << "  --verbose          Debug logging\n"
              << "  --log-level <lvl>  debug | info | warning | error\n"
              << "  --list-triggers    Print the active triggers and exit\n"
              << "  --profile-json <file>     Write per-frame stage timings as JSON\n"
              << "  --profile-summary <file>  Write p50/p90/p99 timing summary\n"
              << "  --help, -h         Show this help\n"
              << std::endl;
}

static bool parseRoiArg(const std::string& s, ROI& roi) {
    std::vector<std::string> parts = splitString(s, ',');
    if (parts.size() != 4) return false;
    try {
        roi.x = std::stoi(parts[0]);
        roi.y = std::stoi(parts[1]);
        roi.w = std::stoi(parts[2]);
        roi.h = std::stoi(parts[3]);
    } catch (const std::exception&) {
        return false;
    }
    if (roi.name.empty()) roi.name = "log";
    return true;
}

static const char* mentionModeName(MentionMode m) {
    switch (m) {
        case MentionMode::HERE: return "here";
        case MentionMode::EVERYONE: return "everyone";
        case MentionMode::CUSTOM: return "custom";
        default: return "none";
    }
}

static void printTriggers(const detect::TriggerSet& set) {
    std::cout << "Triggers (" << set.triggers().size() << "):" << std::endl;
    int idx = 0;
    for (const auto& t : set.triggers()) {
        const char* type = std::holds_alternative<detect::RegexRule>(t.rule) ? "regex" : "keyword";
        std::cout << "  [" << idx++ << "] " << std::left << std::setw(20) << t.name
                  << " " << std::setw(8) << type
                  << " mention=" << mentionModeName(t.mentionMode)
                  << "  " << t.pattern() << std::endl;
    }
    std::cout << "Legacy keywords: " << set.legacyKeywordCount()
              << ", legacy patterns: " << set.legacyPatternCount() << std::endl;
}

int main(int argc, char* argv[]) {
    printBanner();

    // Parse command line arguments
    std::string configPath = kDefaultConfigPath;
    std::string imagePath;
    std::string displayName;
    std::string roiOverride;
    std::string setRoiStr;
    std::string logLevelStr;
    std::string profileJsonPath;
    std::string profileSummaryPath;
    bool once = false;
    bool verbose = false;
    bool listTriggers = false;
    uint64_t maxFrames = 0;
    int intervalOverride = -1;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        try {
            if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            } else if (arg == "--image" && i + 1 < argc) {
                imagePath = argv[++i];
            } else if (arg == "--display" && i + 1 < argc) {
                displayName = argv[++i];
            } else if (arg == "--roi" && i + 1 < argc) {
                roiOverride = argv[++i];
            } else if (arg == "--set-roi" && i + 1 < argc) {
                setRoiStr = argv[++i];
            } else if (arg == "--once") {
                once = true;
            } else if (arg == "--max-frames" && i + 1 < argc) {
                maxFrames = static_cast<uint64_t>((std::max)(0LL, std::stoll(argv[++i])));
            } else if (arg == "--interval" && i + 1 < argc) {
                intervalOverride = (std::max)(0, std::stoi(argv[++i]));
            } else if (arg == "--verbose" || arg == "-v") {
                verbose = true;
            } else if (arg == "--log-level" && i + 1 < argc) {
                logLevelStr = argv[++i];
            } else if (arg == "--list-triggers") {
                listTriggers = true;
            } else if (arg == "--profile-json" && i + 1 < argc) {
                profileJsonPath = argv[++i];
            } else if (arg == "--profile-summary" && i + 1 < argc) {
                profileSummaryPath = argv[++i];
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        } catch (const std::exception&) {
            std::cerr << "Invalid value for " << arg << std::endl;
            return 1;
        }
    }

    if (!setRoiStr.empty()) {
        ROI roi;
        std::string err;
        if (!parseRoiArg(setRoiStr, roi)) {
            std::cerr << "--set-roi expects x,y,w,h" << std::endl;
            return 1;
        }
        if (!validateCaptureRegion(roi, err) || !saveCaptureRegion(configPath, roi, err)) {
            std::cerr << "Failed to save ROI: " << err << std::endl;
            return 1;
        }
        std::cout << "Saved ROI " << roi.x << "," << roi.y << " " << roi.w << "x" << roi.h
                  << " to " << configPath << std::endl;
        return 0;
    }

    // Load configuration
    WatchConfig config;
    std::string configError;
    if (!loadWatchConfig(configPath, config, configError)) {
        logError(configError);
        return 1;
    }

    LogLevel level = parseLogLevel(config.logLevel);
    if (!logLevelStr.empty()) level = parseLogLevel(logLevelStr);
    if (verbose) level = LogLevel::DEBUG;
    setLogLevel(level);

    if (!roiOverride.empty() && !parseRoiArg(roiOverride, config.roi)) {
        logError("--roi expects x,y,w,h");
        return 1;
    }
    if (intervalOverride >= 0) config.captureIntervalMs = intervalOverride;

    if (listTriggers) {
        detect::TriggerSet set(config.triggers, config.keywords, config.regexPatterns);
        printTriggers(set);
        return 0;
    }

    std::string roiError;
    if (!validateCaptureRegion(config.roi, roiError)) {
        logError(roiError + " (set \"roi\" in " + configPath + " or use --set-roi)");
        return 1;
    }

    // Capture backend
    std::unique_ptr<ScreenCapture> capture;
    if (!imagePath.empty()) {
        capture = std::make_unique<ImageFileCapture>(imagePath);
    } else {
        capture = std::make_unique<X11ScreenCapture>(displayName);
    }
    if (!capture->initialize()) {
        logError("Capture init failed: " + capture->getLastError());
        return 1;
    }
    int screenW = 0, screenH = 0;
    capture->getScreenSize(screenW, screenH);
    logInfo("Screen " + std::to_string(screenW) + "x" + std::to_string(screenH) +
            ", ROI " + std::to_string(config.roi.x) + "," + std::to_string(config.roi.y) +
            " " + std::to_string(config.roi.w) + "x" + std::to_string(config.roi.h));

    // OCR engine
    TesseractConfig tessConfig;
    tessConfig.language = config.tesseractLanguage;
    tessConfig.tessDataPath = config.tessdataPath;
    TesseractEngine ocr(tessConfig);
    if (!ocr.initialize()) {
        logError("Tesseract init failed: " + ocr.getLastError());
        return 1;
    }
    logInfo("Tesseract " + TesseractEngine::getVersion() + " (" + config.tesseractLanguage + ")");

    DiscordWebhookNotifier notifier(config.webhookUrl);
    if (notifier.resolveUrl().empty()) {
        logWarning("No webhook URL configured; matches will fail to post");
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    WatchLoop loop(config, *capture, ocr, notifier);
    logInfo("Watching with " + std::to_string(loop.triggers().triggers().size()) + " triggers, " +
            std::to_string(loop.triggers().legacyKeywordCount()) + " legacy keywords, " +
            std::to_string(loop.triggers().legacyPatternCount()) + " legacy patterns");

    Profiler profiler(!profileJsonPath.empty() || !profileSummaryPath.empty());

    uint64_t frames = 0;
    double runMs = 0.0;
    {
        ScopedTimer runTimer(runMs);
        frames = loop.run(g_running, once ? 1 : maxFrames,
                          profiler.enabled() ? &profiler : nullptr);
    }

    if (profiler.enabled()) {
        profiler.flush(profileJsonPath, profileSummaryPath);
    }

    std::cout << "\n=== Run Summary ===" << std::endl;
    std::cout << "Frames processed: " << frames << " in " << std::fixed << std::setprecision(1)
              << (runMs / 1000.0) << " s" << std::endl;
    std::cout << "Notifications posted: " << loop.totalPosted() << std::endl;
    std::cout << "Notification failures: " << loop.totalNotifyFailures() << std::endl;
    std::cout << "Entries remembered: " << loop.registry().size() << std::endl;
    return 0;
}
