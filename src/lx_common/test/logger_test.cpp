#include "lx/common/logger.h"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <streambuf>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "lx/common/utils.hpp"

LX_LOG_USE_SCOPE(test);

#ifdef ENABLE_LOGGING

static constexpr std::size_t c_buffer_size = 4096;

class logger : public testing::Test {
    void SetUp() override {
        // Assign test msg buffer to STDERR
        setvbuf(stderr, m_msg_buffer, _IOFBF, c_buffer_size);

        LX_LOGGER_INIT(LxLoggerOptions{LxLog_Trace, LxLog_Color_Never});
    }

    void TearDown() override {
        // Reset STDERR buffer
        setvbuf(stderr, nullptr, _IONBF, c_buffer_size);
    }

protected:
    void writeTestMsg(LxLogLevel level, char const *msg) {
        std::fflush(stderr);

        // Clear the test msg buffer
        std::memset(m_msg_buffer, 0, c_buffer_size);

        _LX_LOG_CHK(level, "%s", msg);

        // The flushed data stays in the buffer
        std::fflush(stderr);
    }

    struct LogMsg {
        std::string index;
        std::string timestamp;
        std::string level;
        std::string scope;
        std::string text;
    };

    LogMsg parseLogMsg() {
        std::istringstream ss{m_msg_buffer};

        LogMsg msg{};

        ss >> msg.index;
        ss >> msg.timestamp;
        ss >> msg.level;
        ss >> msg.scope;

        msg.text = std::string{std::istreambuf_iterator<char>{ss}, std::istreambuf_iterator<char>{}};

        return msg;
    }

protected: // fields
    char m_msg_buffer[c_buffer_size];
};

#define EXPECT_LOG_MSG(IDX, LEV, SCOPE, TEXT) \
    {                                         \
        auto const msg = parseLogMsg();       \
        EXPECT_EQ(msg.index, (IDX));          \
        EXPECT_EQ(msg.level, (LEV));          \
        EXPECT_EQ(msg.scope, (SCOPE));        \
        EXPECT_EQ(msg.text, (TEXT));          \
    }

TEST_F(logger, write) {
    writeTestMsg(LxLog_Error, "This is error log");
    EXPECT_LOG_MSG("0001", "error", "test", " This is error log\n");

    writeTestMsg(LxLog_Warning, "This is warning log");
    EXPECT_LOG_MSG("0002", "warning", "test", " This is warning log\n");

    writeTestMsg(LxLog_Info, "This is info log");
    EXPECT_LOG_MSG("0003", "info", "test", " This is info log\n");

    writeTestMsg(LxLog_Debug, "This is debug log");
    EXPECT_LOG_MSG("0004", "debug", "test", " This is debug log\n");

    writeTestMsg(LxLog_Trace, "This is trace log");
    EXPECT_LOG_MSG("0005", "trace", "test", " This is trace log\n");
}

TEST_F(logger, level_filter) {
    LX_LOGGER_INIT(LxLoggerOptions{LxLog_Warning, LxLog_Color_Never});

    if (getenv("LX_LOG_LEVEL")) {
        GTEST_SKIP() << "LX_LOG_LEVEL overrides the configured level";
    }

    EXPECT_TRUE(_lx_loggerCheck(LxLog_Error));
    EXPECT_TRUE(_lx_loggerCheck(LxLog_Warning));
    EXPECT_FALSE(_lx_loggerCheck(LxLog_Info));
    EXPECT_FALSE(_lx_loggerCheck(LxLog_Trace));

    writeTestMsg(LxLog_Debug, "Filtered out");
    EXPECT_STREQ(m_msg_buffer, "");
}

TEST_F(logger, env_level) {
    char const *env = getenv("LX_LOG_LEVEL");
    std::string const saved = env ? env : "";
    defer {
        if (saved.empty()) {
            unsetenv("LX_LOG_LEVEL");
        } else {
            setenv("LX_LOG_LEVEL", saved.c_str(), 1);
        }
    };

    setenv("LX_LOG_LEVEL", "error", 1);
    LX_LOGGER_INIT(LxLoggerOptions{LxLog_Trace, LxLog_Color_Never});
    EXPECT_TRUE(_lx_loggerCheck(LxLog_Error));
    EXPECT_FALSE(_lx_loggerCheck(LxLog_Warning));

    setenv("LX_LOG_LEVEL", "none", 1);
    LX_LOGGER_INIT(LxLoggerOptions{LxLog_Trace, LxLog_Color_Never});
    EXPECT_FALSE(_lx_loggerCheck(LxLog_Error));

    // Unknown values keep the configured level
    setenv("LX_LOG_LEVEL", "verbose", 1);
    std::fflush(stderr);
    std::memset(m_msg_buffer, 0, c_buffer_size);
    LX_LOGGER_INIT(LxLoggerOptions{LxLog_Info, LxLog_Color_Never});
    std::fflush(stderr);
    EXPECT_STREQ(m_msg_buffer, "warning: ignoring unknown LX_LOG_LEVEL value `verbose`\n");
    EXPECT_TRUE(_lx_loggerCheck(LxLog_Info));
    EXPECT_FALSE(_lx_loggerCheck(LxLog_Debug));
}

TEST_F(logger, complex) {
    LX_LOG_INF("float=%lf, int=%i", 3.14, 42);
}

TEST_F(logger, threads) {
    std::atomic<bool> stop{false};
    std::thread t1{[&]() {
        while (!stop) {
            LX_LOG_TRC("This is thread 1!");
        }
    }};
    std::thread t2{[&]() {
        while (!stop) {
            LX_LOG_DBG("This is thread 2!");
        }
    }};
    std::this_thread::sleep_for(std::chrono::milliseconds{1});
    stop = true;
    t1.join();
    t2.join();
}

#endif // ENABLE_LOGGING
