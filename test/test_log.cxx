#include <gtest/gtest.h>
#include "Log.hxx"
#include <cstdio>
#include <fstream>
#include <sstream>

TEST(Log, ParseLevel) {
    LogLevel lvl = LogLevel::Error;
    EXPECT_TRUE(Logger::parseLevel("debug", lvl));
    EXPECT_EQ(lvl, LogLevel::Debug);
    EXPECT_TRUE(Logger::parseLevel("WARN", lvl));
    EXPECT_EQ(lvl, LogLevel::Warn);
    EXPECT_TRUE(Logger::parseLevel("Info", lvl));
    EXPECT_EQ(lvl, LogLevel::Info);
    EXPECT_FALSE(Logger::parseLevel("verbose", lvl));
    EXPECT_EQ(lvl, LogLevel::Info);
}

TEST(Log, LevelFiltersMessages) {
    Logger& log = Logger::instance();
    const LogLevel saved = log.level();

    log.setLevel(LogLevel::Warn);
    EXPECT_TRUE(log.enabled(LogLevel::Error));
    EXPECT_TRUE(log.enabled(LogLevel::Warn));
    EXPECT_FALSE(log.enabled(LogLevel::Info));
    EXPECT_FALSE(log.enabled(LogLevel::Debug));

    log.setLevel(LogLevel::Debug);
    EXPECT_TRUE(log.enabled(LogLevel::Debug));
    log.setLevel(saved);
}

TEST(Log, WritesToFile) {
    const char* path = "log_tmp.txt";
    std::remove(path);
    Logger& log = Logger::instance();
    const LogLevel saved = log.level();

    log.setLevel(LogLevel::Info);
    log.setMirrorToStderr(false);
    ASSERT_TRUE(log.setFile(path));
    PROPCURVES_LOG_INFO("curve %d has %zu points", 3, static_cast<std::size_t>(7));
    PROPCURVES_LOG_DEBUG("filtered out");
    ASSERT_TRUE(log.setFile(""));
    log.setMirrorToStderr(true);
    log.setLevel(saved);

    std::ifstream ifs(path);
    std::stringstream ss;
    ss << ifs.rdbuf();
    const std::string text = ss.str();
    EXPECT_NE(text.find("[INFO] curve 3 has 7 points"), std::string::npos) << text;
    EXPECT_EQ(text.find("filtered out"), std::string::npos) << text;
    std::remove(path);
}

TEST(Log, OpenFailureReported) {
    EXPECT_FALSE(Logger::instance().setFile("no_such_dir/log.txt"));
}
