#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "kirei/compositelogger.hpp"

namespace {

// Логгер, запоминающий сообщения в памяти
class RecordingLogger : public kirei::ILogger {
public:
    void init(const kirei::LogLevel level) override { setLogLevel(level); }
    void setLogLevel(kirei::LogLevel level) override { currentLevel_ = level; }
    void flush() override { ++flushes; }

    std::vector<std::string> lines;
    int flushes = 0;

protected:
    void log(kirei::LogLevel level, const std::string& message) override {
        if (shouldSkipLog(level)) return;
        lines.push_back(kirei::leveltoString(level) + ":" + message);
    }
    bool shouldSkipLog(kirei::LogLevel level) const override {
        return static_cast<int>(level) < static_cast<int>(currentLevel_.load());
    }
};

}  // namespace

// Сообщение доставляется каждому зарегистрированному логгеру
TEST(CompositeLoggerTest, FansOutToAllLoggers) {
    auto a = std::make_shared<RecordingLogger>();
    auto b = std::make_shared<RecordingLogger>();
    kirei::CompositeLogger composite{a, b};

    composite.warning("disk almost full");

    ASSERT_EQ(a->lines.size(), 1u);
    ASSERT_EQ(b->lines.size(), 1u);
    EXPECT_EQ(a->lines[0], "WARNING:disk almost full");
}

// Уровень применяется к вложенным логгерам
TEST(CompositeLoggerTest, PropagatesLevel) {
    auto a = std::make_shared<RecordingLogger>();
    kirei::CompositeLogger composite{a};

    composite.setLogLevel(kirei::LogLevel::LOG_ERROR);
    composite.info("dropped");
    composite.error("kept");
    composite.flush();

    ASSERT_EQ(a->lines.size(), 1u);
    EXPECT_EQ(a->lines[0], "ERROR:kept");
    EXPECT_EQ(a->flushes, 1);
}

TEST(CompositeLoggerTest, EmptyCompositeIsSilent) {
    kirei::CompositeLogger composite;
    EXPECT_EQ(composite.size(), 0u);
    EXPECT_NO_THROW(composite.critical("nobody listens"));

    composite.addLogger(nullptr);
    EXPECT_EQ(composite.size(), 0u);
}
