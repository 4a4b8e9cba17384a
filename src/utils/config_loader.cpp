/**
 * @file config_loader.cpp
 * @brief Configuration file loading
 */

#include "utils/config_loader.h"
#include "utils/string_utils.h"

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace log_watchdog {

using json = nlohmann::json;

static json roiToJson(const ROI& roi) {
    json r;
    r["x"] = roi.x;
    r["y"] = roi.y;
    r["w"] = roi.w;
    r["h"] = roi.h;
    return r;
}

MentionMode parseMentionMode(const std::string& s) {
    std::string v = toLower(trim(s));
    if (!v.empty() && v[0] == '@') v = v.substr(1);
    if (v == "here") return MentionMode::HERE;
    if (v == "everyone") return MentionMode::EVERYONE;
    if (v == "custom") return MentionMode::CUSTOM;
    return MentionMode::NONE;
}

MatchType parseMatchType(const std::string& s) {
    return toLower(trim(s)) == "regex" ? MatchType::REGEX : MatchType::KEYWORD;
}

DedupMode parseDedupMode(const std::string& s) {
    return toLower(trim(s)) == "content" ? DedupMode::CONTENT : DedupMode::HEADER;
}

static std::vector<std::string> stringList(const json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key) || !j[key].is_array()) return out;
    for (const auto& item : j[key]) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        } else if (item.is_number_integer()) {
            out.push_back(std::to_string(item.get<long long>()));
        }
    }
    return out;
}

WatchConfig watchConfigFromJson(const json& j) {
    WatchConfig c;
    if (!j.is_object()) return c;

    if (j.contains("roi") && j["roi"].is_object()) {
        const auto& r = j["roi"];
        c.roi.name = r.value("name", "log");
        c.roi.x = r.value("x", 0);
        c.roi.y = r.value("y", 0);
        c.roi.w = r.value("w", 0);
        c.roi.h = r.value("h", 0);
    }

    c.captureIntervalMs = j.value("capture_interval_ms", c.captureIntervalMs);
    c.sendOnlyNewest = j.value("send_only_newest", c.sendOnlyNewest);

    c.ocrScale = j.value("ocr_scale", c.ocrScale);
    c.psmLines = j.value("psm_lines", c.psmLines);
    c.reocrPsm = j.value("reocr_psm", c.reocrPsm);
    c.minWordConf = j.value("min_word_conf", c.minWordConf);
    c.tesseractWhitelist = trim(j.value("tesseract_whitelist", c.tesseractWhitelist));
    c.tesseractLanguage = j.value("tesseract_language", c.tesseractLanguage);
    c.tessdataPath = j.value("tessdata_path", c.tessdataPath);

    c.tightenColumns = j.value("tighten_columns", c.tightenColumns);
    c.entryBboxPadLr = j.value("entry_bbox_pad_lr", c.entryBboxPadLr);
    c.entryBboxPadV = j.value("entry_bbox_pad_v", c.entryBboxPadV);
    c.entryMaxHeightPx = j.value("entry_max_height_px", c.entryMaxHeightPx);
    c.entryHeaderRegex = j.value("entry_header_regex", c.entryHeaderRegex);
    c.entryHeaderKeyword = j.value("entry_header_keyword", c.entryHeaderKeyword);

    if (j.contains("triggers") && j["triggers"].is_array()) {
        for (const auto& t : j["triggers"]) {
            if (!t.is_object()) continue;
            TriggerConfig tc;
            tc.name = t.value("name", "");
            tc.type = parseMatchType(t.value("type", "keyword"));
            tc.match = t.value("match", "");
            tc.mentionMode = parseMentionMode(t.value("mention_mode", "none"));
            tc.mentionCustom = t.value("mention_custom", "");
            tc.prefix = trim(t.value("prefix", ""));
            tc.suffix = trim(t.value("suffix", ""));
            c.triggers.push_back(std::move(tc));
        }
    }

    for (const auto& kw : stringList(j, "keywords")) {
        std::string k = trim(kw);
        if (!k.empty()) c.keywords.push_back(k);
    }
    c.keywordsFile = j.value("keywords_file", "");
    c.regexPatterns = stringList(j, "regex");
    for (const auto& p : stringList(j, "regex_patterns")) c.regexPatterns.push_back(p);

    c.dedupMode = parseDedupMode(j.value("dedup_mode", "header"));
    c.contentDedupTtlS = j.value("content_dedup_ttl_s", c.contentDedupTtlS);
    c.contentDedupMax = j.value("content_dedup_max", c.contentDedupMax);

    c.webhookUrl = trim(j.value("discord_webhook_url", ""));
    if (j.contains("discord_allowed_mentions") && j["discord_allowed_mentions"].is_object()) {
        const auto& am = j["discord_allowed_mentions"];
        c.allowedMentions.everyone = am.value("everyone", false);
        c.allowedMentions.roles = am.value("roles", false);
        c.allowedMentions.users = am.value("users", false);
        c.allowedMentions.roleIds = stringList(am, "role_ids");
        c.allowedMentions.userIds = stringList(am, "user_ids");
    }
    c.attachmentName = j.value("attachment_name", c.attachmentName);

    c.saveCaptures = j.value("save_captures", c.saveCaptures);
    c.captureDir = j.value("capture_dir", c.captureDir);
    c.logLevel = j.value("log_level", c.logLevel);
    return c;
}

size_t appendKeywordsFromFile(const std::string& path, std::vector<std::string>& keywords) {
    std::ifstream in(path);
    if (!in.good()) return 0;

    size_t added = 0;
    std::string line;
    while (std::getline(in, line)) {
        std::string s = trim(line);
        if (s.empty()) continue;
        if (std::find(keywords.begin(), keywords.end(), s) != keywords.end()) continue;
        keywords.push_back(s);
        ++added;
    }
    return added;
}

bool loadWatchConfig(const std::string& path, WatchConfig& out, std::string& errorMessage) {
    errorMessage.clear();

    std::ifstream file(path);
    if (!file.good()) {
        errorMessage = "Cannot open config file: " + path;
        return false;
    }

    try {
        json j = json::parse(file);
        out = watchConfigFromJson(j);
    } catch (const std::exception& e) {
        errorMessage = std::string("Error parsing config: ") + e.what();
        return false;
    }

    if (!out.keywordsFile.empty()) {
        appendKeywordsFromFile(out.keywordsFile, out.keywords);
    }
    return true;
}

bool validateCaptureRegion(const ROI& roi, std::string& errorMessage) {
    errorMessage.clear();
    if (roi.w < 5 || roi.h < 5) {
        errorMessage = "Capture region not set (need at least 5x5 pixels)";
        return false;
    }
    return true;
}

bool saveCaptureRegion(const std::string& path, const ROI& roi, std::string& errorMessage) {
    errorMessage.clear();
    if (roi.w <= 0 || roi.h <= 0) {
        errorMessage = "ROI has non-positive size";
        return false;
    }

    json config = json::object();

    // Load existing file if present.
    {
        std::ifstream in(path);
        if (in.good()) {
            try {
                config = json::parse(in);
            } catch (const std::exception& e) {
                errorMessage = std::string("Error parsing config: ") + e.what();
                return false;
            }
        }
    }

    if (!config.is_object()) {
        config = json::object();
    }
    config["roi"] = roiToJson(roi);

    try {
        std::filesystem::path p(path);
        if (p.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(p.parent_path(), ec);
        }

        std::ofstream out(path, std::ios::trunc);
        if (!out.good()) {
            errorMessage = "Cannot open config for writing: " + path;
            return false;
        }
        out << config.dump(2) << std::endl;
    } catch (const std::exception& e) {
        errorMessage = std::string("Error writing config: ") + e.what();
        return false;
    }

    return true;
}

} // namespace log_watchdog
