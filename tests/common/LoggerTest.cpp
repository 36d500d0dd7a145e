#include <gtest/gtest.h>
#include <codemap/common/Logger.h>
#include <codemap/ingest/GraphIngest.h>

#include <memory>
#include <string>
#include <vector>

using namespace codemap;

// ============================================================================
// LoggerTest - 로거 백엔드 주입 및 캡처 테스트
// ============================================================================

namespace {

struct RecordedLine {
    LogLevel level;
    std::string text;
};

// Shared with the test body because Logger owns the backend
struct Recording {
    std::vector<RecordedLine> lines;
    LogLevel threshold = LogLevel::Trace;
    int flushCount = 0;
};

class RecordingBackend : public ILoggerBackend {
public:
    explicit RecordingBackend(std::shared_ptr<Recording> recording)
        : recording_(std::move(recording)) {}

    void log(LogLevel level, const std::string& line, const std::source_location&) override {
        if (level >= recording_->threshold) {
            recording_->lines.push_back({level, line});
        }
    }
    void setLevel(LogLevel level) override { recording_->threshold = level; }
    void flush() override { ++recording_->flushCount; }

private:
    std::shared_ptr<Recording> recording_;
};

}  // namespace

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        recording_ = std::make_shared<Recording>();
        previous_ = Logger::setBackend(std::make_unique<RecordingBackend>(recording_));
    }

    void TearDown() override {
        Logger::setBackend(std::move(previous_));
        Logger::enableCapture(false);
        Logger::clearCapturedLogs();
    }

    std::vector<std::string> linesAt(LogLevel level) const {
        std::vector<std::string> out;
        for (const auto& line : recording_->lines) {
            if (line.level == level) out.push_back(line.text);
        }
        return out;
    }

    std::shared_ptr<Recording> recording_;
    std::unique_ptr<ILoggerBackend> previous_;
};

TEST_F(LoggerTest, InjectedBackend_ReceivesIngestWarnings) {
    CodeGraph graph;
    graph.nodes = {GraphNode("a", "a", NodeKind::Function, "x.py"),
                   GraphNode("a", "dup", NodeKind::Function, "x.py")};
    graph.edges = {{"a", "ghost"}};

    GraphIngest::normalize(graph);

    std::vector<std::string> warnings = linesAt(LogLevel::Warn);
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_NE(warnings[0].find("Duplicate node id 'a'"), std::string::npos);
    EXPECT_NE(warnings[1].find("ghost"), std::string::npos);
    // Lines carry the emitting function
    EXPECT_NE(warnings[1].find("GraphIngest::normalize() - "), std::string::npos);
}

TEST_F(LoggerTest, SetLevelAndFlush_ReachBackend) {
    Logger::setLevel(LogLevel::Error);
    EXPECT_EQ(recording_->threshold, LogLevel::Error);

    LOG_WARN("filtered {}", 1);
    LOG_ERROR("kept {}", 2);
    ASSERT_EQ(recording_->lines.size(), 1u);
    EXPECT_NE(recording_->lines[0].text.find("kept 2"), std::string::npos);

    Logger::flush();
    EXPECT_EQ(recording_->flushCount, 1);
}

TEST_F(LoggerTest, SetBackend_ReturnsReplacedBackend) {
    auto second = std::make_shared<Recording>();
    std::unique_ptr<ILoggerBackend> ours = Logger::setBackend(std::make_unique<RecordingBackend>(second));
    ASSERT_NE(ours, nullptr);

    LOG_INFO("to second");
    EXPECT_TRUE(recording_->lines.empty());
    EXPECT_EQ(second->lines.size(), 1u);

    Logger::setBackend(std::move(ours));
    LOG_INFO("to first");
    EXPECT_EQ(recording_->lines.size(), 1u);
}

TEST_F(LoggerTest, Capture_TagsLevelAndIgnoresBackendThreshold) {
    EXPECT_FALSE(Logger::isCaptureEnabled());
    Logger::enableCapture(true);
    EXPECT_TRUE(Logger::isCaptureEnabled());

    Logger::setLevel(LogLevel::Off);
    LOG_DEBUG("layer {} done", 0);
    LOG_WARN("layer {} done", 1);
    LOG_WARN("layer {} done", 2);

    EXPECT_TRUE(recording_->lines.empty());

    std::vector<std::string> all = Logger::getCapturedLogs("layer");
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].rfind("[debug] ", 0), 0u);
    EXPECT_EQ(all[1].rfind("[warn] ", 0), 0u);

    std::vector<std::string> newest = Logger::getCapturedLogs("layer", 1);
    ASSERT_EQ(newest.size(), 1u);
    EXPECT_NE(newest[0].find("layer 2 done"), std::string::npos);

    Logger::enableCapture(false);
    LOG_WARN("not kept");
    EXPECT_TRUE(Logger::getCapturedLogs("not kept").empty());
}

TEST(LogLevelTest, ParseAndName) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("WARN"), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("err"), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());

    EXPECT_STREQ(logLevelName(LogLevel::Critical), "critical");
    EXPECT_EQ(parseLogLevel(logLevelName(LogLevel::Trace)), LogLevel::Trace);
}
