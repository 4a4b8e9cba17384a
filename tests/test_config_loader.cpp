#include "utils/config_loader.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace log_watchdog;
namespace fs = std::filesystem;

namespace {

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        m_dir = fs::temp_directory_path() / (std::string("lw_config_") + info->name());
        fs::remove_all(m_dir);
        fs::create_directories(m_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(m_dir, ec);
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        fs::path p = m_dir / name;
        std::ofstream out(p);
        out << content;
        return p.string();
    }

    fs::path m_dir;
};

} // namespace

TEST_F(ConfigLoaderTest, MissingFileFails) {
    WatchConfig cfg;
    std::string err;
    EXPECT_FALSE(loadWatchConfig((m_dir / "nope.json").string(), cfg, err));
    EXPECT_NE(err.find("Cannot open"), std::string::npos);
}

TEST_F(ConfigLoaderTest, InvalidJsonFails) {
    WatchConfig cfg;
    std::string err;
    EXPECT_FALSE(loadWatchConfig(writeFile("bad.json", "{ \"roi\": "), cfg, err));
    EXPECT_FALSE(err.empty());
}

TEST_F(ConfigLoaderTest, EmptyObjectKeepsDefaults) {
    WatchConfig cfg;
    std::string err;
    ASSERT_TRUE(loadWatchConfig(writeFile("empty.json", "{}"), cfg, err)) << err;
    EXPECT_EQ(cfg.captureIntervalMs, 750);
    EXPECT_TRUE(cfg.sendOnlyNewest);
    EXPECT_DOUBLE_EQ(cfg.ocrScale, 2.0);
    EXPECT_EQ(cfg.entryMaxHeightPx, 360);
    EXPECT_EQ(cfg.dedupMode, DedupMode::HEADER);
    EXPECT_EQ(cfg.attachmentName, "ark_log_hit.png");
    EXPECT_TRUE(cfg.triggers.empty());
}

TEST_F(ConfigLoaderTest, ParsesFullConfig) {
    const std::string json = R"({
        "roi": {"x": 10, "y": 20, "w": 400, "h": 300},
        "capture_interval_ms": 1000,
        "send_only_newest": false,
        "ocr_scale": 1.5,
        "psm_lines": 11,
        "reocr_psm": 4,
        "min_word_conf": 30,
        "tesseract_whitelist": " ABC ",
        "tighten_columns": false,
        "entry_bbox_pad_lr": 2,
        "entry_bbox_pad_v": 3,
        "entry_max_height_px": 200,
        "triggers": [
            {"name": "Kill", "type": "regex", "match": "killed", "mention_mode": "@here",
             "prefix": " alert ", "suffix": "end"},
            {"name": "Custom", "type": "keyword", "match": "tamed", "mention_mode": "custom",
             "mention_custom": "<@&42>"},
            {"name": "Odd", "match": "x", "mention_mode": "sometimes"}
        ],
        "keywords": ["destroyed", " "],
        "regex": ["a+"],
        "regex_patterns": ["b+"],
        "dedup_mode": "content",
        "content_dedup_ttl_s": 30,
        "discord_webhook_url": " https://example.invalid/hook ",
        "discord_allowed_mentions": {"everyone": true, "role_ids": ["1", 2]},
        "save_captures": false,
        "log_level": "debug"
    })";

    WatchConfig cfg;
    std::string err;
    ASSERT_TRUE(loadWatchConfig(writeFile("full.json", json), cfg, err)) << err;

    EXPECT_EQ(cfg.roi.x, 10);
    EXPECT_EQ(cfg.roi.h, 300);
    EXPECT_EQ(cfg.captureIntervalMs, 1000);
    EXPECT_FALSE(cfg.sendOnlyNewest);
    EXPECT_DOUBLE_EQ(cfg.ocrScale, 1.5);
    EXPECT_EQ(cfg.psmLines, 11);
    EXPECT_EQ(cfg.reocrPsm, 4);
    EXPECT_EQ(cfg.minWordConf, 30);
    EXPECT_EQ(cfg.tesseractWhitelist, "ABC");
    EXPECT_FALSE(cfg.tightenColumns);
    EXPECT_EQ(cfg.entryBboxPadLr, 2);
    EXPECT_EQ(cfg.entryBboxPadV, 3);
    EXPECT_EQ(cfg.entryMaxHeightPx, 200);

    ASSERT_EQ(cfg.triggers.size(), 3u);
    EXPECT_EQ(cfg.triggers[0].type, MatchType::REGEX);
    EXPECT_EQ(cfg.triggers[0].mentionMode, MentionMode::HERE);
    EXPECT_EQ(cfg.triggers[0].prefix, "alert");
    EXPECT_EQ(cfg.triggers[1].type, MatchType::KEYWORD);
    EXPECT_EQ(cfg.triggers[1].mentionMode, MentionMode::CUSTOM);
    EXPECT_EQ(cfg.triggers[1].mentionCustom, "<@&42>");
    EXPECT_EQ(cfg.triggers[2].type, MatchType::KEYWORD);
    EXPECT_EQ(cfg.triggers[2].mentionMode, MentionMode::NONE);

    ASSERT_EQ(cfg.keywords.size(), 1u);
    EXPECT_EQ(cfg.keywords[0], "destroyed");
    ASSERT_EQ(cfg.regexPatterns.size(), 2u);
    EXPECT_EQ(cfg.dedupMode, DedupMode::CONTENT);
    EXPECT_EQ(cfg.contentDedupTtlS, 30);
    EXPECT_EQ(cfg.webhookUrl, "https://example.invalid/hook");
    EXPECT_TRUE(cfg.allowedMentions.everyone);
    EXPECT_EQ(cfg.allowedMentions.roleIds, (std::vector<std::string>{"1", "2"}));
    EXPECT_FALSE(cfg.saveCaptures);
    EXPECT_EQ(cfg.logLevel, "debug");
}

TEST_F(ConfigLoaderTest, WrongTypeIsAnError) {
    WatchConfig cfg;
    std::string err;
    EXPECT_FALSE(loadWatchConfig(writeFile("typed.json", R"({"capture_interval_ms": "fast"})"),
                                 cfg, err));
    EXPECT_FALSE(err.empty());
}

TEST_F(ConfigLoaderTest, KeywordsFileMerged) {
    std::string kwPath = writeFile("keywords.txt", "destroyed\n\n  starved  \ndestroyed\n");
    std::string json = "{\"keywords\": [\"destroyed\"], \"keywords_file\": \"" + kwPath + "\"}";

    WatchConfig cfg;
    std::string err;
    ASSERT_TRUE(loadWatchConfig(writeFile("kw.json", json), cfg, err)) << err;
    EXPECT_EQ(cfg.keywords, (std::vector<std::string>{"destroyed", "starved"}));
}

TEST_F(ConfigLoaderTest, MissingKeywordsFileIsIgnored) {
    std::vector<std::string> kws{"a"};
    EXPECT_EQ(appendKeywordsFromFile((m_dir / "missing.txt").string(), kws), 0u);
    EXPECT_EQ(kws.size(), 1u);
}

TEST_F(ConfigLoaderTest, CaptureRegionValidation) {
    std::string err;
    EXPECT_FALSE(validateCaptureRegion(ROI{}, err));
    EXPECT_FALSE(err.empty());
    EXPECT_FALSE(validateCaptureRegion(ROI{"r", 0, 0, 4, 100}, err));
    EXPECT_FALSE(validateCaptureRegion(ROI{"r", 0, 0, 100, 4}, err));
    EXPECT_TRUE(validateCaptureRegion(ROI{"r", 0, 0, 5, 5}, err));
    EXPECT_TRUE(err.empty());
}

TEST_F(ConfigLoaderTest, SaveCaptureRegionPreservesOtherFields) {
    std::string path = writeFile("roi.json", R"({"capture_interval_ms": 500})");
    std::string err;
    ASSERT_TRUE(saveCaptureRegion(path, ROI{"log", 1, 2, 300, 200}, err)) << err;

    WatchConfig cfg;
    ASSERT_TRUE(loadWatchConfig(path, cfg, err)) << err;
    EXPECT_EQ(cfg.captureIntervalMs, 500);
    EXPECT_EQ(cfg.roi.x, 1);
    EXPECT_EQ(cfg.roi.y, 2);
    EXPECT_EQ(cfg.roi.w, 300);
    EXPECT_EQ(cfg.roi.h, 200);
}

TEST_F(ConfigLoaderTest, SaveCaptureRegionCreatesFile) {
    std::string path = (m_dir / "sub" / "new.json").string();
    std::string err;
    ASSERT_TRUE(saveCaptureRegion(path, ROI{"log", 0, 0, 10, 10}, err)) << err;
    EXPECT_TRUE(fs::exists(path));
    EXPECT_FALSE(saveCaptureRegion(path, ROI{"log", 0, 0, 0, 10}, err));
}

TEST(ConfigEnumTest, MentionModeSpellings) {
    EXPECT_EQ(parseMentionMode("here"), MentionMode::HERE);
    EXPECT_EQ(parseMentionMode("@everyone"), MentionMode::EVERYONE);
    EXPECT_EQ(parseMentionMode(" CUSTOM "), MentionMode::CUSTOM);
    EXPECT_EQ(parseMentionMode(""), MentionMode::NONE);
    EXPECT_EQ(parseMatchType("Regex"), MatchType::REGEX);
    EXPECT_EQ(parseMatchType("other"), MatchType::KEYWORD);
    EXPECT_EQ(parseDedupMode("content"), DedupMode::CONTENT);
    EXPECT_EQ(parseDedupMode("anything"), DedupMode::HEADER);
}
