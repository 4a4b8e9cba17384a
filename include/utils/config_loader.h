#pragma once
/**
 * @file config_loader.h
 * @brief Configuration file loading utilities
 */

#include "types.h"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace log_watchdog {

/// Default configuration path (relative to the working directory)
inline constexpr const char* kDefaultConfigPath = "config/watchdog_config.json";

/**
 * @brief Build a WatchConfig from parsed JSON
 *
 * Missing keys keep their defaults, unknown keys are ignored.
 * Throws nlohmann::json::exception on wrongly typed values.
 */
WatchConfig watchConfigFromJson(const nlohmann::json& j);

/**
 * @brief Load the watch configuration
 *
 * Also merges keywords from "keywords_file" when it exists.
 *
 * @param path Path to watchdog_config.json
 * @param out Parsed configuration
 * @param errorMessage Populated on failure
 * @return true on success
 */
bool loadWatchConfig(const std::string& path, WatchConfig& out, std::string& errorMessage);

/**
 * @brief Read one keyword per line, skipping blanks and existing entries
 * @return Keywords appended to @p keywords
 */
size_t appendKeywordsFromFile(const std::string& path, std::vector<std::string>& keywords);

/**
 * @brief Check that the capture region is set and at least 5x5
 */
bool validateCaptureRegion(const ROI& roi, std::string& errorMessage);

/**
 * @brief Write or replace the "roi" object in the config JSON
 *
 * Preserves other top-level fields. If the file does not exist,
 * a minimal structure will be created.
 */
bool saveCaptureRegion(const std::string& path, const ROI& roi, std::string& errorMessage);

MentionMode parseMentionMode(const std::string& s);
MatchType parseMatchType(const std::string& s);
DedupMode parseDedupMode(const std::string& s);

} // namespace log_watchdog
