#include "common/Logger.h"
#include "backends/SpdlogBackend.h"
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace WCE;

namespace {

struct CapturedLine {
    LogLevel level;
    std::string message;
};

class CapturingBackend : public ILoggerBackend {
public:
    explicit CapturingBackend(std::shared_ptr<std::vector<CapturedLine>> lines) : lines_(std::move(lines)) {}

    void log(LogLevel level, const std::string &message, const std::source_location &) override {
        if (level < minLevel_) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        lines_->push_back({level, message});
    }

    void setLevel(LogLevel level) override {
        minLevel_ = level;
    }

    void flush() override {}

private:
    std::shared_ptr<std::vector<CapturedLine>> lines_;
    LogLevel minLevel_ = LogLevel::Trace;
    std::mutex mutex_;
};

}  // namespace

void logFromNamedFunction(int value) {
    LOG_WARN("value is {}", value);
}

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        lines = std::make_shared<std::vector<CapturedLine>>();
        Logger::setBackend(std::make_unique<CapturingBackend>(lines));
    }

    void TearDown() override {
        Logger::setBackend(std::make_unique<SpdlogBackend>());
        Logger::setLevel(LogLevel::Warn);
    }

    std::shared_ptr<std::vector<CapturedLine>> lines;
};

TEST_F(LoggerTest, MacrosFormatAndPrefixFunctionName) {
    logFromNamedFunction(42);

    ASSERT_EQ(lines->size(), 1u);
    EXPECT_EQ((*lines)[0].level, LogLevel::Warn);
    EXPECT_NE((*lines)[0].message.find("logFromNamedFunction() - value is 42"), std::string::npos);
}

TEST_F(LoggerTest, LevelIsForwardedToBackend) {
    Logger::setLevel(LogLevel::Error);

    LOG_INFO("dropped");
    LOG_ERROR("kept {}", "error");

    ASSERT_EQ(lines->size(), 1u);
    EXPECT_EQ((*lines)[0].level, LogLevel::Error);
}

TEST_F(LoggerTest, LevelNamesAreCaseInsensitive) {
    EXPECT_EQ(logLevelFromString("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(logLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(logLevelFromString("err"), LogLevel::Error);
    EXPECT_EQ(logLevelFromString("verbose", LogLevel::Critical), LogLevel::Critical);
}

TEST_F(LoggerTest, InitializeKeepsInstalledBackend) {
    Logger::initialize();
    LOG_INFO("still captured");

    ASSERT_EQ(lines->size(), 1u);
    EXPECT_NE((*lines)[0].message.find("still captured"), std::string::npos);
}
