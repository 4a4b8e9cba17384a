#include "watch/watch_loop.h"

#include <gtest/gtest.h>

#include <deque>
#include <sstream>

using namespace log_watchdog;

namespace {

class FakeCapture : public ScreenCapture {
public:
    FakeCapture(int w, int h) : m_frame(h, w, CV_8UC3, cv::Scalar(20, 20, 20)) {}

    bool initialize() override { return true; }
    void getScreenSize(int& width, int& height) const override {
        width = m_frame.cols;
        height = m_frame.rows;
    }
    bool capture(const ROI&, cv::Mat& out) override {
        if (fail) {
            m_lastError = "display gone";
            return false;
        }
        out = m_frame.clone();
        return true;
    }
    const std::string& getLastError() const override { return m_lastError; }

    bool fail = false;

private:
    cv::Mat m_frame;
    std::string m_lastError;
};

/// Full-frame calls get the line pass words; smaller crops get queued entry words.
class FakeOcr : public OcrEngine {
public:
    explicit FakeOcr(int frameRows) : m_frameRows(frameRows) {}

    bool recognize(const cv::Mat& image, const OcrParams& params,
                   std::vector<OcrWord>& words) override {
        psms.push_back(params.psm);
        if (image.rows == m_frameRows) {
            words = frameWords;
            return true;
        }
        words.clear();
        if (!entryWords.empty()) {
            words = entryWords.front();
            entryWords.pop_front();
        }
        return true;
    }
    const std::string& getLastError() const override { return m_lastError; }

    std::vector<OcrWord> frameWords;
    std::deque<std::vector<OcrWord>> entryWords;
    std::vector<int> psms;

private:
    int m_frameRows;
    std::string m_lastError;
};

class FakeNotifier : public Notifier {
public:
    bool send(const NotificationMessage& message) override {
        sent.push_back(message);
        if (fail) {
            m_lastError = "HTTP 500";
            return false;
        }
        return true;
    }
    const std::string& getLastError() const override { return m_lastError; }

    std::vector<NotificationMessage> sent;
    bool fail = false;

private:
    std::string m_lastError;
};

void appendLine(std::vector<OcrWord>& out, const std::string& text, int y, int lineIdx,
                int conf = 90) {
    std::istringstream iss(text);
    std::string token;
    int x = 5;
    int wordIdx = 1;
    while (iss >> token) {
        OcrWord w;
        w.text = token;
        w.confidence = conf;
        w.box = BBox{x, y, 8 * static_cast<int>(token.size()), 14};
        w.page = 1;
        w.block = 1;
        w.paragraph = 1;
        w.line = lineIdx;
        w.word = wordIdx++;
        out.push_back(w);
        x += w.box.w + 6;
    }
}

std::vector<OcrWord> entryResponse(const std::vector<std::string>& lines) {
    std::vector<OcrWord> out;
    int y = 2;
    int idx = 1;
    for (const auto& ln : lines) {
        appendLine(out, ln, y, idx++);
        y += 28;
    }
    return out;
}

constexpr int kFrameW = 320;
constexpr int kFrameH = 300;

class WatchLoopTest : public ::testing::Test {
protected:
    WatchLoopTest() : capture(kFrameW, kFrameH), ocr(kFrameH) {
        config.roi = ROI{"log", 0, 0, kFrameW, kFrameH};
        config.ocrScale = 1.0;
        config.tightenColumns = false;
        config.saveCaptures = false;
        config.captureIntervalMs = 0;
        config.psmLines = 11;
        config.reocrPsm = 6;

        TriggerConfig destroyed;
        destroyed.name = "Destroyed";
        destroyed.type = MatchType::KEYWORD;
        destroyed.match = "destroyed";
        destroyed.mentionMode = MentionMode::HERE;
        config.triggers.push_back(destroyed);

        appendLine(ocr.frameWords, "Day 10, 01:00:00:", 10, 1);
        appendLine(ocr.frameWords, "Your Wall was destroyed!", 40, 2);
        appendLine(ocr.frameWords, "Day 10, 01:00:05:", 110, 3);
        appendLine(ocr.frameWords, "Your Gate was destroyed!", 140, 4);
    }

    WatchConfig config;
    FakeCapture capture;
    FakeOcr ocr;
    FakeNotifier notifier;
};

} // namespace

TEST(FormatNotificationTest, FullLayout) {
    detect::Trigger t;
    t.name = "Kill";
    t.mentionMode = MentionMode::EVERYONE;
    t.prefix = "Base alert";
    t.suffix = "-- bot";
    EXPECT_EQ(formatNotification(t, "Bob was killed", 87.9f, "killed"),
              "@everyone\nBase alert\n**ARK Watchdog match**\n"
              "- [87%] Bob was killed (match: killed)\n-- bot");
}

TEST(FormatNotificationTest, MinimalLayout) {
    detect::Trigger t;
    EXPECT_EQ(formatNotification(t, "text", 50.0f, ""),
              "**ARK Watchdog match**\n- [50%] text (match: trigger)");
}

TEST_F(WatchLoopTest, OnlyNewestEntryPostedOncePerKey) {
    ocr.entryWords.push_back(entryResponse({"Day 10, 01:00:00:", "Your Wall was destroyed!"}));
    ocr.entryWords.push_back(entryResponse({"Day 10, 01:00:00:", "Your Wall was destroyed!"}));

    WatchLoop loop(config, capture, ocr, notifier);

    FrameReport first = loop.processFrame(0);
    EXPECT_TRUE(first.captured);
    EXPECT_EQ(first.ocrLines, 4);
    EXPECT_EQ(first.headers, 2);
    EXPECT_EQ(first.candidates, 1);
    EXPECT_EQ(first.posted, 1);

    ASSERT_EQ(notifier.sent.size(), 1u);
    const auto& msg = notifier.sent[0];
    EXPECT_EQ(msg.content,
              "@here\n**ARK Watchdog match**\n"
              "- [90%] Day 10, 01:00:00: Your Wall was destroyed! (match: destroyed)");
    EXPECT_EQ(msg.filename, "ark_log_hit.png");
    EXPECT_FALSE(msg.image.empty());
    EXPECT_TRUE(loop.registry().seen("d10-t010000"));

    FrameReport second = loop.processFrame(1);
    EXPECT_EQ(second.posted, 0);
    EXPECT_EQ(second.duplicates, 1);
    EXPECT_EQ(notifier.sent.size(), 1u);

    // Line pass then entry pass, each with its own page segmentation.
    ASSERT_GE(ocr.psms.size(), 2u);
    EXPECT_EQ(ocr.psms[0], 11);
    EXPECT_EQ(ocr.psms[1], 6);
}

TEST_F(WatchLoopTest, AllEntriesWhenNotOnlyNewest) {
    config.sendOnlyNewest = false;
    ocr.entryWords.push_back(entryResponse({"Day 10, 01:00:00:", "Your Wall was destroyed!"}));
    ocr.entryWords.push_back(entryResponse({"Day 10, 01:00:05:", "Your Gate was destroyed!"}));

    WatchLoop loop(config, capture, ocr, notifier);
    FrameReport report = loop.processFrame(0);
    EXPECT_EQ(report.candidates, 2);
    EXPECT_EQ(report.posted, 2);
    EXPECT_TRUE(loop.registry().seen("d10-t010000"));
    EXPECT_TRUE(loop.registry().seen("d10-t010005"));
}

TEST_F(WatchLoopTest, UnmatchedEntryIsNotMarkedSeen) {
    ocr.entryWords.push_back(entryResponse({"Day 10, 01:00:00:", "Bob joined the tribe"}));
    ocr.entryWords.push_back(entryResponse({"Day 10, 01:00:00:", "Your Wall was destroyed!"}));

    WatchLoop loop(config, capture, ocr, notifier);

    FrameReport first = loop.processFrame(0);
    EXPECT_EQ(first.unmatched, 1);
    EXPECT_EQ(first.posted, 0);
    EXPECT_FALSE(loop.registry().seen("d10-t010000"));

    FrameReport second = loop.processFrame(1);
    EXPECT_EQ(second.posted, 1);
}

TEST_F(WatchLoopTest, LostHeaderIsRecovered) {
    ocr.entryWords.push_back(entryResponse({"Your Wall was destroyed!"}));

    WatchLoop loop(config, capture, ocr, notifier);
    FrameReport report = loop.processFrame(0);
    EXPECT_EQ(report.posted, 1);
    ASSERT_EQ(notifier.sent.size(), 1u);
    EXPECT_NE(notifier.sent[0].content.find("Day 10, 01:00:00: Your Wall was destroyed!"),
              std::string::npos);
    EXPECT_TRUE(loop.registry().seen("d10-t010000"));
}

TEST_F(WatchLoopTest, UnrecoverableHeaderSkipsEntry) {
    config.entryHeaderRegex = R"(^\[\d+\])";
    ocr.frameWords.clear();
    appendLine(ocr.frameWords, "[12] alpha", 10, 1);
    appendLine(ocr.frameWords, "destroyed things", 40, 2);
    ocr.entryWords.push_back(entryResponse({"destroyed things"}));

    WatchLoop loop(config, capture, ocr, notifier);
    FrameReport report = loop.processFrame(0);
    EXPECT_EQ(report.headers, 1);
    EXPECT_EQ(report.skipped, 1);
    EXPECT_EQ(report.posted, 0);
    EXPECT_EQ(loop.registry().size(), 0u);
}

TEST_F(WatchLoopTest, EmptyEntryTextSkipped) {
    // No queued response: the entry pass returns no words.
    WatchLoop loop(config, capture, ocr, notifier);
    FrameReport report = loop.processFrame(0);
    EXPECT_EQ(report.posted, 0);
    EXPECT_EQ(report.skipped, 1);
    EXPECT_TRUE(notifier.sent.empty());
}

TEST_F(WatchLoopTest, NotifyFailureStillMarksKey) {
    notifier.fail = true;
    ocr.entryWords.push_back(entryResponse({"Day 10, 01:00:00:", "Your Wall was destroyed!"}));
    ocr.entryWords.push_back(entryResponse({"Day 10, 01:00:00:", "Your Wall was destroyed!"}));

    WatchLoop loop(config, capture, ocr, notifier);
    FrameReport first = loop.processFrame(0);
    EXPECT_EQ(first.notifyFailures, 1);
    EXPECT_EQ(first.posted, 0);
    EXPECT_EQ(loop.totalNotifyFailures(), 1);

    FrameReport second = loop.processFrame(1);
    EXPECT_EQ(second.duplicates, 1);
    EXPECT_EQ(notifier.sent.size(), 1u);
}

TEST_F(WatchLoopTest, ContentDedupMode) {
    config.dedupMode = DedupMode::CONTENT;
    ocr.entryWords.push_back(entryResponse({"Day 10, 01:00:00:", "Your Wall was destroyed!"}));
    ocr.entryWords.push_back(entryResponse({"Day 10, 01:00:00:", "Your Wall was destroyed!"}));
    ocr.entryWords.push_back(entryResponse({"Day 10, 01:00:00:", "Your Roof was destroyed!"}));

    WatchLoop loop(config, capture, ocr, notifier);
    EXPECT_EQ(loop.processFrame(0).posted, 1);
    EXPECT_EQ(loop.processFrame(1).duplicates, 1);
    EXPECT_EQ(loop.processFrame(2).posted, 1);
    EXPECT_EQ(loop.registry().size(), 0u);
}

TEST_F(WatchLoopTest, CaptureFailureSkipsFrame) {
    capture.fail = true;
    WatchLoop loop(config, capture, ocr, notifier);
    FrameReport report = loop.processFrame(0);
    EXPECT_FALSE(report.captured);
    EXPECT_TRUE(ocr.psms.empty());
}

TEST_F(WatchLoopTest, RunStopsAfterMaxFrames) {
    ocr.entryWords.push_back(entryResponse({"Day 10, 01:00:00:", "Your Wall was destroyed!"}));
    ocr.entryWords.push_back(entryResponse({"Day 10, 01:00:00:", "Your Wall was destroyed!"}));
    ocr.entryWords.push_back(entryResponse({"Day 10, 01:00:00:", "Your Wall was destroyed!"}));

    WatchLoop loop(config, capture, ocr, notifier);
    std::atomic<bool> running{true};
    Profiler profiler(true);
    EXPECT_EQ(loop.run(running, 3, &profiler), 3u);
    EXPECT_EQ(loop.totalPosted(), 1);
    ASSERT_EQ(profiler.rows().size(), 3u);
    EXPECT_EQ(profiler.rows()[0].headers, 2);
    EXPECT_EQ(profiler.rows()[0].posted, 1);
}

TEST_F(WatchLoopTest, RunReturnsImmediatelyWhenStopped) {
    WatchLoop loop(config, capture, ocr, notifier);
    std::atomic<bool> running{false};
    EXPECT_EQ(loop.run(running, 0), 0u);
}
